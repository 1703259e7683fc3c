/**
 * Registering pgvec codecs with a database client.
 *
 * This example demonstrates:
 * - Loading the codec configuration from PGVEC_* environment variables
 * - Obtaining the per-type encode/decode hooks
 * - Encoding column values the way a client would for a binary-format parameter
 * - Decoding the bytes the server sends back
 *
 * The client itself is out of scope; the hooks are printed instead of registered.
 */

#include <pgvec/pgvec.hpp>
#include <iostream>
#include <random>
#include <span>
#include <vector>

namespace {

std::vector<double> generate_embedding(std::size_t dim, std::uint32_t seed, double density) {
    std::mt19937 gen(seed);
    std::uniform_real_distribution<float> dist(0.0f, 1.0f);
    std::vector<double> vec(dim, 0.0);
    for (auto& v : vec) {
        if (dist(gen) < density) v = dist(gen);
    }
    return vec;
}

pgvec::codec::FloatSequence as_column_value(const std::vector<double>& v) {
    return pgvec::codec::FloatSequence(v.begin(), v.end());
}

} // namespace

int main() {
    using namespace pgvec;

    auto cfg = load_codec_config_from_env();
    if (!cfg) {
        std::cerr << "config error: " << cfg.error().message << "\n";
        return 1;
    }

    const auto codecs = codec::type_codecs(*cfg);
    for (const auto& c : codecs) {
        std::cout << "register " << c.schema << "." << c.type_name
                  << " format=" << c.format
                  << " cosine index ops=" << cosine_ops(c.kind) << "\n";
    }

    const auto dense = generate_embedding(1536, 42, 1.0);
    const auto sparse = generate_embedding(1536, 43, 0.1);

    for (const auto& c : codecs) {
        const auto& input = (c.kind == VectorKind::sparsevec) ? sparse : dense;
        auto wire = c.encoder(as_column_value(input));
        if (!wire) {
            std::cerr << c.type_name << ": encode failed: " << wire.error().message << "\n";
            return 1;
        }
        std::cout << c.type_name << ": " << (*wire)->size() << " wire bytes\n";

        auto value = c.decoder(std::span<const std::uint8_t>(**wire));
        if (!value) {
            std::cerr << c.type_name << ": decode failed: " << value.error().message << "\n";
            return 1;
        }
        std::cout << c.type_name << ": decoded " << to_string(**value) << "\n";
    }

    // SQL NULL survives both directions untouched
    auto null_wire = codecs[0].encoder(codec::Absent{});
    std::cout << "NULL encodes to " << ((null_wire && !null_wire->has_value()) ? "NULL" : "bytes") << "\n";

    return 0;
}

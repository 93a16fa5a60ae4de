#include "opencbor/build_info.h"
#include "opencbor/cbor_decode.h"
#include "opencbor/cbor_format.h"
#include "opencbor/climate_packet.h"
#include "opencbor/hex_payload.h"
#include "opencbor/resource_policy.h"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace opencbor {
namespace {

    enum class ReadFileStatus : uint8_t {
        Ok,
        OpenFailed,
        IoFailed,
        TooLarge,
    };

    static ReadFileStatus read_file_bytes(const char* path,
                                          std::vector<std::byte>* out,
                                          uint64_t max_file_bytes,
                                          uint64_t* out_size)
    {
        out->clear();
        if (out_size) {
            *out_size = 0;
        }
        std::FILE* f = std::fopen(path, "rb");
        if (!f) {
            return ReadFileStatus::OpenFailed;
        }

        if (std::fseek(f, 0, SEEK_END) != 0) {
            std::fclose(f);
            return ReadFileStatus::IoFailed;
        }
        const long end = std::ftell(f);
        if (end < 0) {
            std::fclose(f);
            return ReadFileStatus::IoFailed;
        }
        if (std::fseek(f, 0, SEEK_SET) != 0) {
            std::fclose(f);
            return ReadFileStatus::IoFailed;
        }

        const uint64_t size_u64 = static_cast<uint64_t>(end);
        if (out_size) {
            *out_size = size_u64;
        }
        if (max_file_bytes != 0U && size_u64 > max_file_bytes) {
            std::fclose(f);
            return ReadFileStatus::TooLarge;
        }

        const size_t size = static_cast<size_t>(size_u64);
        out->resize(size);
        if (size != 0) {
            const size_t read = std::fread(out->data(), 1, size, f);
            if (read != size) {
                std::fclose(f);
                out->clear();
                return ReadFileStatus::IoFailed;
            }
        }
        std::fclose(f);
        return ReadFileStatus::Ok;
    }

    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || !*s) {
            return false;
        }
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }

    static bool parse_u32_arg(const char* s, uint32_t* out)
    {
        uint64_t v = 0;
        if (!parse_u64_arg(s, &v) || v > 0xffffffffULL) {
            return false;
        }
        *out = static_cast<uint32_t>(v);
        return true;
    }

    // Keeps tags and custom simple values independently.
    class DumpHooks final : public CborDecodeHooks {
    public:
        bool keep_tags   = false;
        bool keep_simple = false;

        CborNodeId on_tag(CborDocument& doc, CborNodeId inner,
                          uint64_t tag) override
        {
            if (!keep_tags) {
                return inner;
            }
            return doc.add_tagged(tag, inner);
        }

        CborNodeId on_simple(CborDocument& doc, uint8_t code) override
        {
            if (!keep_simple) {
                return doc.add_value(make_cbor_simple(CborSimple::Undefined));
            }
            return doc.add_value(make_cbor_custom_simple(code));
        }
    };

    static void print_decode_result(const CborDecodeResult& r)
    {
        std::printf("status=%s items=%u offset=%llu",
                    cbor_decode_status_name(r.status), r.items_decoded,
                    static_cast<unsigned long long>(r.offset));
        if (r.status == CborDecodeStatus::LimitExceeded) {
            std::printf(" limit=%s", cbor_limit_reason_name(r.limit_reason));
        }
        std::printf("\n");
    }

    static void print_climate_value(const char* name, bool has, int64_t v)
    {
        if (has) {
            std::printf("  %s=%lld\n", name, static_cast<long long>(v));
        } else {
            std::printf("  %s=-\n", name);
        }
    }

    static bool dump_climate(std::span<const std::byte> bytes,
                             const CborDecodeOptions& options)
    {
        ClimateReading reading;
        const ClimatePacketResult r = decode_climate_packet(bytes, &reading,
                                                            options);
        std::printf("climate=%s\n", climate_packet_status_name(r.status));
        if (r.status == ClimatePacketStatus::DecodeFailed) {
            print_decode_result(r.cbor);
            return false;
        }
        if (r.status != ClimatePacketStatus::Ok) {
            return false;
        }
        print_climate_value("temperature", reading.has_temperature,
                            reading.temperature);
        print_climate_value("humidity", reading.has_humidity,
                            reading.humidity);
        print_climate_value("co2", reading.has_co2, reading.co2);
        return true;
    }

    static bool dump_tree(std::span<const std::byte> bytes,
                          const CborDecodeOptions& options,
                          const CborFormatOptions& format)
    {
        CborDocument doc;
        const CborDecodeResult r = decode_cbor(bytes, doc, options);
        print_decode_result(r);
        if (r.status != CborDecodeStatus::Ok) {
            return false;
        }
        std::printf("nodes=%u root=%s\n", doc.node_count(),
                    cbor_value_kind_name(doc.node(r.root).kind));

        std::string line;
        if (!format_cbor_diagnostic(doc, r.root, &line, format)) {
            return false;
        }
        std::printf("%s\n", line.c_str());
        return true;
    }

    static void usage(const char* argv0)
    {
        std::printf("usage: %s [options] <file> [file...]\n", argv0);
        std::printf("       %s [options] --hex <hex> [hex...]\n", argv0);
        std::printf("options:\n");
        std::printf("  --version             print build info and exit\n");
        std::printf("  --no-build-info       hide build info header\n");
        std::printf("  --hex                 treat arguments as hex payloads\n");
        std::printf("  --climate             read arguments as climate sensor packets\n");
        std::printf("  --keep-tags           print tags as N(value) instead of dropping them\n");
        std::printf("  --keep-simple         print unassigned simple values as simple(N)\n");
        std::printf(
            "  --max-depth N         max nesting depth (default: 256; 0=unlimited)\n");
        std::printf(
            "  --max-items N         max decoded items (default: 1000000; 0=unlimited)\n");
        std::printf(
            "  --max-string-bytes N  max bytes per decoded string (default: 67108864; 0=unlimited)\n");
        std::printf(
            "  --max-elements N      max container elements to print (default: 64)\n");
        std::printf(
            "  --max-bytes N         max bytes to print for text/bytes (default: 256)\n");
        std::printf(
            "  --max-file-bytes N    refuse to read files larger than N bytes (default: 67108864; 0=unlimited)\n");
    }

    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(build_info(), &line1, &line2);
        std::printf("%s\n", line1.c_str());
        std::printf("%s\n", line2.c_str());
    }

}  // namespace
}  // namespace opencbor

int
main(int argc, char** argv)
{
    using namespace opencbor;

    bool show_build_info = true;
    bool hex_args        = false;
    bool climate         = false;
    DumpHooks hooks;

    CborResourcePolicy policy;
    policy.max_file_bytes   = 64ULL * 1024ULL * 1024ULL;
    policy.format.max_items = 64;
    policy.format.max_bytes = 256;

    int first_path = 1;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_build_info_header();
            return 0;
        }
        if (std::strcmp(arg, "--no-build-info") == 0) {
            show_build_info = false;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--hex") == 0) {
            hex_args = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--climate") == 0) {
            climate = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--keep-tags") == 0) {
            hooks.keep_tags = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--keep-simple") == 0) {
            hooks.keep_simple = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--max-depth") == 0 && i + 1 < argc) {
            uint32_t v = 0;
            if (!parse_u32_arg(argv[i + 1], &v)) {
                std::fprintf(stderr, "invalid --max-depth value\n");
                return 2;
            }
            policy.decode_limits.max_depth = v;
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-items") == 0 && i + 1 < argc) {
            uint32_t v = 0;
            if (!parse_u32_arg(argv[i + 1], &v)) {
                std::fprintf(stderr, "invalid --max-items value\n");
                return 2;
            }
            policy.decode_limits.max_items = v;
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-string-bytes") == 0 && i + 1 < argc) {
            uint64_t v = 0;
            if (!parse_u64_arg(argv[i + 1], &v)) {
                std::fprintf(stderr, "invalid --max-string-bytes value\n");
                return 2;
            }
            policy.decode_limits.max_string_bytes = v;
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-elements") == 0 && i + 1 < argc) {
            uint32_t v = 0;
            if (!parse_u32_arg(argv[i + 1], &v)) {
                std::fprintf(stderr, "invalid --max-elements value\n");
                return 2;
            }
            policy.format.max_items = v;
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-bytes") == 0 && i + 1 < argc) {
            uint32_t v = 0;
            if (!parse_u32_arg(argv[i + 1], &v)) {
                std::fprintf(stderr, "invalid --max-bytes value\n");
                return 2;
            }
            policy.format.max_bytes = v;
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-file-bytes") == 0 && i + 1 < argc) {
            uint64_t v = 0;
            if (!parse_u64_arg(argv[i + 1], &v)) {
                std::fprintf(stderr, "invalid --max-file-bytes value\n");
                return 2;
            }
            policy.max_file_bytes                = v;
            policy.decode_limits.max_input_bytes = v;
            i += 1;
            first_path += 2;
            continue;
        }
        break;
    }

    if (argc <= first_path) {
        usage(argv[0]);
        return 2;
    }

    CborDecodeOptions decode_options;
    CborFormatOptions format_options;
    apply_resource_policy(policy, &decode_options, &format_options);
    decode_options.hooks = &hooks;

    if (show_build_info) {
        print_build_info_header();
    }

    int exit_code = 0;
    for (int argi = first_path; argi < argc; ++argi) {
        const char* path = argv[argi];
        if (!path || !*path) {
            continue;
        }

        std::vector<std::byte> bytes;
        if (hex_args) {
            if (decode_hex_payload(path, &bytes) != HexPayloadStatus::Ok) {
                std::fprintf(stderr, "cbordump: invalid hex payload `%s`\n",
                             path);
                exit_code = 1;
                continue;
            }
        } else {
            uint64_t file_size      = 0;
            const ReadFileStatus st = read_file_bytes(path, &bytes,
                                                      policy.max_file_bytes,
                                                      &file_size);
            if (st != ReadFileStatus::Ok) {
                if (st == ReadFileStatus::TooLarge) {
                    std::fprintf(
                        stderr,
                        "cbordump: refusing to read `%s` (size=%llu > --max-file-bytes=%llu)\n",
                        path, static_cast<unsigned long long>(file_size),
                        static_cast<unsigned long long>(policy.max_file_bytes));
                } else if (st == ReadFileStatus::OpenFailed) {
                    std::fprintf(stderr, "cbordump: failed to open `%s`\n",
                                 path);
                } else {
                    std::fprintf(stderr, "cbordump: failed to read `%s`\n",
                                 path);
                }
                exit_code = 1;
                continue;
            }
        }

        std::printf("== %s\n", path);
        std::printf("size=%zu\n", bytes.size());

        const bool ok = climate
                            ? dump_climate(bytes, decode_options)
                            : dump_tree(bytes, decode_options, format_options);
        if (!ok) {
            std::fprintf(stderr, "cbordump: failed to decode `%s`\n", path);
            exit_code = 1;
        }
    }
    return exit_code;
}

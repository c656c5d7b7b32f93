#include "archive/archive_extractor.hpp"
#include "crypto/aead.hpp"
#include "crypto/key_material.hpp"
#include "crypto/sha256.hpp"
#include "io/file_io.hpp"
#include "util/command_output.hpp"
#include "util/config.hpp"
#include "util/env_template.hpp"
#include "util/hex.hpp"
#include "util/logger.hpp"
#include "util/requirement.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <optional>
#include <string>
#include <sys/stat.h>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void PrintUsage(const char* argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c <config>] [-q|-v] <command> [options]\n"
        "\n"
        "Commands:\n"
        "  extract -i <archive|-> -d <dir> [-s <n>] [--sha256 <hex>] [--no-perms] [--no-times]\n"
        "  seal    -i <input|-> -o <output|-> [-k <keyfile>] [-n <nonce-hex>]\n"
        "  open    -i <input|-> -o <output|-> [-k <keyfile>] [-n <nonce-hex>]\n"
        "  expand  <template>...\n"
        "  format-req <name> [--extra <e>]... [--spec <s>]... [--url <u>] [--marker <m>]\n"
        "\n"
        "Global options:\n"
        "  -c, --config    Config file (default %s)\n"
        "  -q, --quiet     Only report errors\n"
        "  -v, --verbose   Debug output\n"
        "  -h, --help      Show this help\n"
        "\n"
        "seal/open without -n use the envelope form: a random nonce is stored\n"
        "in front of the ciphertext.\n",
        argv0, stash::config::kDefaultConfigPath);
}

bool ParseCount(const char* s, std::size_t& out) {
    if (!s || *s == '\0' || *s == '-') return false;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(s, &end, 10);
    if (!end || *end != '\0') return false;
    out = static_cast<std::size_t>(v);
    return true;
}

int Fail(const stash::Result& r) {
    LogError("%s: %s", stash::ErrorKindName(r.kind), r.msg.c_str());
    return kExitFailure;
}

struct Settings {
    stash::config::StashConfigFromFile cfg;
};

int RunExtract(int argc, char** argv, const Settings& s) {
    const char* in = nullptr;
    const char* dst = nullptr;
    const char* sha256 = nullptr;

    stash::ArchiveExtractor::Options opt;
    opt.strip_components = s.cfg.strip_components.value_or(0);
    opt.preserve_permissions = s.cfg.preserve_permissions.value_or(true);
    opt.preserve_times = s.cfg.preserve_times.value_or(true);

    enum { kOptSha256 = 1000, kOptNoPerms, kOptNoTimes };
    static option long_opts[] = {
        {"input", required_argument, nullptr, 'i'},
        {"dest", required_argument, nullptr, 'd'},
        {"strip-components", required_argument, nullptr, 's'},
        {"sha256", required_argument, nullptr, kOptSha256},
        {"no-perms", no_argument, nullptr, kOptNoPerms},
        {"no-times", no_argument, nullptr, kOptNoTimes},
        {nullptr, 0, nullptr, 0},
    };

    // 0 makes GNU getopt reinitialize after the global pass.
    optind = 0;
    int c;
    while ((c = getopt_long(argc, argv, "i:d:s:", long_opts, nullptr)) != -1) {
        switch (c) {
            case 'i': in = optarg; break;
            case 'd': dst = optarg; break;
            case 's':
                if (!ParseCount(optarg, opt.strip_components)) {
                    std::fprintf(stderr, "Invalid --strip-components: %s\n", optarg);
                    return kExitUsage;
                }
                break;
            case kOptSha256: sha256 = optarg; break;
            case kOptNoPerms: opt.preserve_permissions = false; break;
            case kOptNoTimes: opt.preserve_times = false; break;
            default: return kExitUsage;
        }
    }
    if (!in || !dst) {
        std::fprintf(stderr, "extract needs -i and -d\n");
        return kExitUsage;
    }

    std::vector<std::uint8_t> archive;
    if (auto r = stash::LoadFile(in, archive); !r.is_ok()) return Fail(r);

    if (sha256 && !stash::VerifySha256Hex(archive, sha256)) {
        LogError("sha256 mismatch for %s (got %s)", in, stash::Sha256Hex(archive).c_str());
        return kExitFailure;
    }

    stash::ArchiveExtractor extractor(opt);
    if (auto r = extractor.Extract(archive, dst); !r.is_ok()) return Fail(r);
    return kExitOk;
}

// Options shared by seal and open.
struct CipherArgs {
    const char* in = nullptr;
    const char* out = nullptr;
    std::string key_file;
    std::optional<stash::AeadNonce> nonce;
};

int ParseCipherArgs(int argc, char** argv, const Settings& s, CipherArgs& a) {
    static option long_opts[] = {
        {"input", required_argument, nullptr, 'i'},
        {"output", required_argument, nullptr, 'o'},
        {"key", required_argument, nullptr, 'k'},
        {"nonce", required_argument, nullptr, 'n'},
        {nullptr, 0, nullptr, 0},
    };

    if (s.cfg.key_file) a.key_file = *s.cfg.key_file;

    optind = 0;
    int c;
    while ((c = getopt_long(argc, argv, "i:o:k:n:", long_opts, nullptr)) != -1) {
        switch (c) {
            case 'i': a.in = optarg; break;
            case 'o': a.out = optarg; break;
            case 'k': a.key_file = optarg; break;
            case 'n': {
                std::vector<std::uint8_t> bytes;
                if (!stash::HexDecode(optarg, bytes) || bytes.size() != stash::kAeadNonceSize) {
                    std::fprintf(stderr, "Invalid --nonce: expected %zu hex bytes\n", stash::kAeadNonceSize);
                    return kExitUsage;
                }
                stash::AeadNonce n{};
                std::copy(bytes.begin(), bytes.end(), n.begin());
                a.nonce = n;
                break;
            }
            default: return kExitUsage;
        }
    }
    if (!a.in || !a.out) {
        std::fprintf(stderr, "-i and -o are required\n");
        return kExitUsage;
    }
    if (a.key_file.empty()) {
        std::fprintf(stderr, "no key file: pass -k or set KeyFile in the config\n");
        return kExitUsage;
    }
    return kExitOk;
}

stash::Result LoadKey(const std::string& path, std::vector<std::uint8_t>& key) {
    std::vector<std::uint8_t> raw;
    auto r = stash::LoadFile(path, raw);
    if (!r.is_ok()) return r;
    r = stash::ParseKeyMaterial(raw, key);
    stash::SecureWipe(raw);
    if (!r.is_ok()) r.msg += ": " + path;
    return r;
}

int RunSeal(int argc, char** argv, const Settings& s) {
    CipherArgs a;
    if (int rc = ParseCipherArgs(argc, argv, s, a); rc != kExitOk) return rc;

    std::vector<std::uint8_t> key;
    if (auto r = LoadKey(a.key_file, key); !r.is_ok()) return Fail(r);

    std::vector<std::uint8_t> plain;
    if (auto r = stash::LoadFile(a.in, plain); !r.is_ok()) {
        stash::SecureWipe(key);
        return Fail(r);
    }

    std::vector<std::uint8_t> sealed;
    const stash::Result r = a.nonce ? stash::AeadSeal(plain, key, *a.nonce, sealed)
                                    : stash::SealWithRandomNonce(plain, key, sealed);
    stash::SecureWipe(key);
    stash::SecureWipe(plain);
    if (!r.is_ok()) return Fail(r);

    if (auto w = stash::WriteFileAtomic(a.out, sealed, S_IRUSR | S_IWUSR); !w.is_ok()) return Fail(w);
    LogDebug("sealed %zu bytes into %s", sealed.size(), a.out);
    return kExitOk;
}

int RunOpen(int argc, char** argv, const Settings& s) {
    CipherArgs a;
    if (int rc = ParseCipherArgs(argc, argv, s, a); rc != kExitOk) return rc;

    std::vector<std::uint8_t> key;
    if (auto r = LoadKey(a.key_file, key); !r.is_ok()) return Fail(r);

    std::vector<std::uint8_t> sealed;
    if (auto r = stash::LoadFile(a.in, sealed); !r.is_ok()) {
        stash::SecureWipe(key);
        return Fail(r);
    }

    auto plain = a.nonce ? stash::AeadOpen(sealed, key, *a.nonce) : stash::OpenEnvelope(sealed, key);
    stash::SecureWipe(key);
    if (!plain) {
        LogError("decryption failed");
        return kExitFailure;
    }

    auto w = stash::WriteFileAtomic(a.out, *plain, S_IRUSR | S_IWUSR);
    stash::SecureWipe(*plain);
    if (!w.is_ok()) return Fail(w);
    return kExitOk;
}

int RunExpand(int argc, char** argv) {
    if (argc < 2) {
        std::fprintf(stderr, "expand needs at least one template\n");
        return kExitUsage;
    }
    for (int i = 1; i < argc; ++i) {
        std::printf("%s\n", stash::ExpandFromEnvironment(argv[i]).c_str());
    }
    return kExitOk;
}

int RunFormatRequirement(int argc, char** argv) {
    enum { kOptExtra = 1000, kOptSpec, kOptUrl, kOptMarker };
    static option long_opts[] = {
        {"extra", required_argument, nullptr, kOptExtra},
        {"spec", required_argument, nullptr, kOptSpec},
        {"url", required_argument, nullptr, kOptUrl},
        {"marker", required_argument, nullptr, kOptMarker},
        {nullptr, 0, nullptr, 0},
    };

    stash::Requirement req;
    optind = 0;
    int c;
    while ((c = getopt_long(argc, argv, "", long_opts, nullptr)) != -1) {
        switch (c) {
            case kOptExtra: req.extras.emplace_back(optarg); break;
            case kOptSpec: req.version_specifiers.emplace_back(optarg); break;
            case kOptUrl: req.url = optarg; break;
            case kOptMarker: req.marker = optarg; break;
            default: return kExitUsage;
        }
    }
    if (optind != argc - 1) {
        std::fprintf(stderr, "format-req needs exactly one name\n");
        return kExitUsage;
    }
    req.name = argv[optind];
    std::printf("%s\n", stash::FormatRequirement(req).c_str());
    return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
    const char* config_cli = nullptr;
    bool quiet = false;
    bool verbose = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"quiet", no_argument, nullptr, 'q'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    // '+' stops at the command name so its options are parsed separately.
    int c;
    while ((c = getopt_long(argc, argv, "+c:qvh", long_opts, nullptr)) != -1) {
        switch (c) {
            case 'c': config_cli = optarg; break;
            case 'q': quiet = true; break;
            case 'v': verbose = true; break;
            case 'h':
                PrintUsage(argv[0]);
                return kExitOk;
            default:
                PrintUsage(argv[0]);
                return kExitUsage;
        }
    }
    if (optind >= argc) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    Settings settings;
    const std::string config_path = config_cli ? config_cli : stash::config::kDefaultConfigPath;
    struct stat st{};
    if (config_cli || ::stat(config_path.c_str(), &st) == 0) {
        if (auto r = settings.cfg.LoadFile(config_path); !r.is_ok()) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return kExitFailure;
        }
    }

    auto& logger = stash::Logger::Instance();
    if (quiet || verbose) {
        logger.SetLevel(stash::LogLevelFor(stash::CommandOutputFromFlags(quiet, verbose)));
    } else if (settings.cfg.log_level) {
        logger.SetLevel(*settings.cfg.log_level);
    }

    const std::string command = argv[optind];
    const int sub_argc = argc - optind;
    char** sub_argv = argv + optind;

    if (command == "extract") return RunExtract(sub_argc, sub_argv, settings);
    if (command == "seal") return RunSeal(sub_argc, sub_argv, settings);
    if (command == "open") return RunOpen(sub_argc, sub_argv, settings);
    if (command == "expand") return RunExpand(sub_argc, sub_argv);
    if (command == "format-req") return RunFormatRequirement(sub_argc, sub_argv);

    std::fprintf(stderr, "Unknown command: %s\n", command.c_str());
    PrintUsage(argv[0]);
    return kExitUsage;
}

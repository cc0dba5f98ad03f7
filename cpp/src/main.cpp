#include "chunkvault/chunkvault.hpp"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

namespace {

namespace fs = std::filesystem;
using namespace chunkvault;

void PrintUsage() {
    std::cout << "Usage:\n";
    std::cout << "  chunkvault_cli keygen [--out <prefix>]\n";
    std::cout << "  chunkvault_cli chunk <file|dir> <outdir> [--quiet]\n";
    std::cout << "  chunkvault_cli reconstruct <manifest.json|dir> <outdir> [--quiet]\n";
    std::cout << "  chunkvault_cli verify <manifest.json|dir>\n";
    std::cout << "  chunkvault_cli info <manifest.json>\n";
    std::cout << "  chunkvault_cli gc <dir> [--dry-run]\n";
    std::cout << "  chunkvault_cli version\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  " << constants::kEnvPublicKey << " / " << constants::kEnvPublicKeyFile << "\n";
    std::cout << "  " << constants::kEnvPrivateKey << " / " << constants::kEnvPrivateKeyFile << "\n";
    std::cout << "  " << constants::kEnvMaxArtifactSize << " (default " << constants::kDefaultMaxArtifactSize << ")\n";
    std::cout << "  " << constants::kEnvChunkSize << " (default " << constants::kDefaultChunkSize << ")\n";
    std::cout << "  " << constants::kEnvCompression << " zlib|xz, " << constants::kEnvCompressionLevel << "\n";
    std::cout << "  " << constants::kEnvWorkers << ", " << constants::kEnvCacheBytes << "\n";
}

struct ProgressReporter {
    bool enabled = true;
    bool printed = false;
    bool use_ansi = false;
    std::chrono::steady_clock::time_point last_tick{};

    ProgressReporter() {
        const char* term = std::getenv("TERM");
        const char* no_color = std::getenv("NO_COLOR");
        use_ansi = !no_color && term && std::string(term) != "dumb";
        last_tick = std::chrono::steady_clock::now();
    }

    static std::string RenderBar(double fraction, int width = 30) {
        if (fraction < 0.0) {
            fraction = 0.0;
        } else if (fraction > 1.0) {
            fraction = 1.0;
        }
        int filled = static_cast<int>(std::round(fraction * width));
        std::string bar;
        bar.reserve(static_cast<std::size_t>(width + 2));
        bar.push_back('(');
        bar.append(static_cast<std::size_t>(filled), '#');
        bar.append(static_cast<std::size_t>(width - filled), ' ');
        bar.push_back(')');
        return bar;
    }

    void Update(const Progress& progress) {
        if (!enabled) {
            return;
        }
        double fraction = progress.Fraction();
        auto now = std::chrono::steady_clock::now();
        auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_tick);
        if (printed && delta.count() < 120 && fraction < 1.0) {
            return;
        }
        last_tick = now;
        int pct = static_cast<int>(std::round(fraction * 100.0));
        std::string line = progress.name + " " + RenderBar(fraction) + " " + std::to_string(pct) + "% "
                           + progress.phase + " " + std::to_string(progress.chunks_done) + "/"
                           + std::to_string(progress.chunks_total);
        if (use_ansi) {
            std::cout << "\r\033[2K" << line << std::flush;
        } else {
            std::cout << line << std::endl;
        }
        printed = true;
    }

    void Finish() {
        if (printed && use_ansi) {
            std::cout << std::endl;
        }
        printed = false;
    }

    ProgressFn Callback() {
        if (!enabled) {
            return {};
        }
        return [this](const Progress& progress) { Update(progress); };
    }
};

struct CommandArgs {
    std::vector<std::string> positional;
    std::string out;
    bool quiet = false;
    bool dry_run = false;
};

CommandArgs ParseArgs(int argc, char** argv, int start_index) {
    CommandArgs args;
    for (int idx = start_index; idx < argc; ++idx) {
        std::string flag(argv[idx]);
        if (flag == "--quiet" || flag == "-q") {
            args.quiet = true;
        } else if (flag == "--dry-run") {
            args.dry_run = true;
        } else if (flag == "--out") {
            if (idx + 1 >= argc) {
                throw std::runtime_error("Missing value for --out");
            }
            args.out = argv[++idx];
        } else if (flag.size() > 1 && flag[0] == '-') {
            throw std::runtime_error("Unknown option: " + flag);
        } else {
            args.positional.push_back(flag);
        }
    }
    return args;
}

std::string HumanSize(std::uint64_t bytes) {
    const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), unit == 0 ? "%.0f %s" : "%.1f %s", value, units[unit]);
    return buffer;
}

config::Config LoadValidatedConfig() {
    config::Config cfg = config::LoadConfig();
    config::Validate(cfg);
    if (auto warning = config::HeadroomWarning(cfg)) {
        std::cerr << "WARN: " << *warning << "\n";
    }
    return cfg;
}

// A manifest argument names either one "<name>.manifest.json" file or a
// directory of them; artifacts live beside the manifests.
struct ManifestSource {
    fs::path dir;
    std::vector<std::string> names;
};

ManifestSource ResolveManifests(const std::string& input) {
    ManifestSource source;
    fs::path path(input);
    if (fs::is_directory(path)) {
        source.dir = path;
        source.names = store::FileManifestStore(path).List();
        return source;
    }
    std::string file = path.filename().string();
    std::string suffix(constants::kManifestSuffix);
    if (file.size() <= suffix.size() || file.compare(file.size() - suffix.size(), suffix.size(), suffix) != 0) {
        throw std::runtime_error("Expected a *" + suffix + " file or a directory: " + input);
    }
    source.dir = path.has_parent_path() ? path.parent_path() : fs::path(".");
    source.names.push_back(file.substr(0, file.size() - suffix.size()));
    return source;
}

void PrintManifest(const manifest::Manifest& m) {
    std::cout << "name: " << m.original_name << "\n";
    std::cout << "original_size: " << m.original_size << " bytes (" << HumanSize(m.original_size) << ")\n";
    std::cout << "chunked: " << (m.IsChunked() ? "yes" : "no") << "\n";
    std::cout << "chunks: " << m.NumChunks() << "\n";
    std::cout << "chunk_size: " << m.chunk_size_target << "\n";
    std::cout << "max_artifact_size: " << m.max_artifact_size << "\n";
    std::cout << "compression: " << compression::Name(m.compression) << "\n";
    std::cout << "created_at: " << (m.created_at.empty() ? "<unknown>" : m.created_at) << "\n";
    std::uint64_t stored = 0;
    for (const auto& record : m.Records()) {
        stored += record.ciphertext_size;
        std::cout << "  [" << record.index << "] " << record.location << " " << record.ciphertext_size << " <- "
                  << record.plaintext_size << " sha256:" << crypto::HexEncode(record.plaintext_hash) << "\n";
    }
    std::cout << "stored_size: " << stored << " bytes (" << HumanSize(stored) << ")\n";
}

int RunKeygen(const CommandArgs& args) {
    envelope::KeyPair pair = envelope::GenerateKeyPair();
    if (args.out.empty()) {
        std::cout << constants::kEnvPublicKey << "=" << pair.public_key << "\n";
        std::cout << constants::kEnvPrivateKey << "=" << pair.private_key << "\n";
        return 0;
    }
    fileio::WriteFileAtomic(args.out + ".pub", pair.public_key + "\n");
    fileio::WriteFileAtomic(args.out + ".key", pair.private_key + "\n");
    std::error_code ec;
    fs::permissions(args.out + ".key", fs::perms::owner_read | fs::perms::owner_write, ec);
    if (ec) {
        std::cerr << "WARN: could not restrict permissions on " << args.out << ".key: " << ec.message() << "\n";
    }
    std::cout << "public key: " << args.out << ".pub\n";
    std::cout << "private key: " << args.out << ".key\n";
    std::cout << pair.public_key << "\n";
    return 0;
}

int RunChunk(const CommandArgs& args) {
    if (args.positional.size() != 2) {
        PrintUsage();
        return 2;
    }
    config::Config cfg = LoadValidatedConfig();
    std::string public_key = config::RequirePublicKey(cfg);
    store::FileArtifactStore artifacts(args.positional[1]);
    store::FileManifestStore manifests(args.positional[1]);

    ProgressReporter reporter;
    reporter.enabled = !args.quiet;
    chunker::WriteOptions options;
    options.limits = cfg.limits;
    options.codec.compression = cfg.compression;
    options.codec.level = cfg.compression_level;
    options.workers = cfg.workers;
    options.progress = reporter.Callback();
    chunker::Chunker chunker(artifacts, manifests, public_key, options);

    std::vector<manifest::Manifest> produced;
    if (fs::is_directory(args.positional[0])) {
        produced = chunker.PlanAndEncodeDirectory(args.positional[0]);
    } else {
        produced.push_back(chunker.PlanAndEncodeFile(args.positional[0]));
    }
    reporter.Finish();
    for (const auto& m : produced) {
        std::uint64_t stored = 0;
        for (const auto& record : m.Records()) {
            stored += record.ciphertext_size;
        }
        std::cout << m.original_name << ": " << HumanSize(m.original_size) << " -> " << HumanSize(stored) << " in "
                  << m.NumChunks() << (m.NumChunks() == 1 ? " artifact" : " artifacts") << "\n";
    }
    return 0;
}

int RunReconstruct(const CommandArgs& args) {
    if (args.positional.size() != 2) {
        PrintUsage();
        return 2;
    }
    config::Config cfg = config::LoadConfig();
    std::string private_key = config::RequirePrivateKey(cfg);
    ManifestSource source = ResolveManifests(args.positional[0]);
    store::FileArtifactStore artifacts(source.dir);
    store::FileManifestStore manifests(source.dir);
    cache::TransformCache cache(cache::MakePolicy(cfg.cache_bytes));

    ProgressReporter reporter;
    reporter.enabled = !args.quiet;
    reassembler::ReadOptions options;
    options.workers = cfg.workers;
    options.progress = reporter.Callback();
    reassembler::Reassembler reader(artifacts, private_key, &cache, options);

    fs::path out_dir(args.positional[1]);
    for (const auto& name : source.names) {
        manifest::Manifest m = manifests.Load(name);
        fs::path target = out_dir / m.original_name;
        reader.ReconstructToFile(m, target.string());
        reporter.Finish();
        std::cout << m.original_name << ": " << HumanSize(m.original_size) << " -> " << target.string() << "\n";
    }
    return 0;
}

int RunVerify(const CommandArgs& args) {
    if (args.positional.size() != 1) {
        PrintUsage();
        return 2;
    }
    config::Config cfg = config::LoadConfig();
    std::string private_key = config::RequirePrivateKey(cfg);
    ManifestSource source = ResolveManifests(args.positional[0]);
    store::FileArtifactStore artifacts(source.dir);
    store::FileManifestStore manifests(source.dir);
    reassembler::ReadOptions options;
    options.workers = cfg.workers;
    reassembler::Reassembler reader(artifacts, private_key, nullptr, options);

    bool all_ok = true;
    for (const auto& name : source.names) {
        reassembler::VerifyReport report = reader.Verify(manifests.Load(name));
        if (report.ok()) {
            std::cout << report.name << ": OK (" << report.chunks_checked << " chunks)\n";
            continue;
        }
        all_ok = false;
        std::cout << report.name << ": FAILED (" << report.failures.size() << " of " << report.chunks_checked
                  << " chunks)\n";
        for (const auto& failure : report.failures) {
            std::cout << "  [" << failure.index << "] " << failure.kind << ": " << failure.message << "\n";
        }
    }
    return all_ok ? 0 : 1;
}

int RunInfo(const CommandArgs& args) {
    if (args.positional.size() != 1) {
        PrintUsage();
        return 2;
    }
    PrintManifest(manifest::FromJson(fileio::ReadText(args.positional[0])));
    return 0;
}

int RunGc(const CommandArgs& args) {
    if (args.positional.size() != 1) {
        PrintUsage();
        return 2;
    }
    store::FileArtifactStore artifacts(args.positional[0]);
    store::FileManifestStore manifests(args.positional[0]);
    chunker::GcReport report = chunker::CollectGarbage(artifacts, manifests, args.dry_run);
    for (const auto& location : report.removed) {
        std::cout << (args.dry_run ? "would remove " : "removed ") << location << "\n";
    }
    std::cout << report.removed.size() << " orphaned, " << report.kept << " referenced\n";
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 2;
    }
    std::string command(argv[1]);
    try {
        if (command == "version" || command == "--version") {
            std::cout << "chunkvault " << constants::kVersion << "\n";
            return 0;
        }
        CommandArgs args = ParseArgs(argc, argv, 2);
        if (command == "keygen") {
            return RunKeygen(args);
        }
        if (command == "chunk") {
            return RunChunk(args);
        }
        if (command == "reconstruct") {
            return RunReconstruct(args);
        }
        if (command == "verify") {
            return RunVerify(args);
        }
        if (command == "info") {
            return RunInfo(args);
        }
        if (command == "gc") {
            return RunGc(args);
        }
        PrintUsage();
        return 2;
    } catch (const std::exception& exc) {
        std::cerr << "Error: " << exc.what() << "\n";
        return 1;
    }
}

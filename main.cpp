#include "lib/injection_orchestrator.hpp"
#include "lib/debian_profile.hpp"
#include "lib/checksum_manifest.hpp"
#include "lib/mbr_extractor.hpp"
#include "lib/iso_extractor.hpp"
#include "lib/initrd_patcher.hpp"
#include "lib/process_runner.hpp"
#include "lib/errors.hpp"
#include "utils/logs.hpp"
#include "utils/colors.hpp"
#include "misc/version.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <getopt.h>

enum class Mode {
    INJECT,
    EXTRACT_MBR,
    REGENERATE,
    VERIFY
};

struct Options {
    Mode mode = Mode::INJECT;
    std::string inputPath;
    std::string outputPath;
    std::string treePath;
    std::string filesystemName = "Debian";
    std::string arch;
    std::string dist;
    std::string overlayDir;
    std::string profile = "debian";
    std::vector<Injection::InitrdInjection> injections;
    bool absolutePatchMode = false;
    bool dryRun = false;
};

void printUsage() {
    std::cout << Colors::bold("Usage:") << " injectiso -i <input.iso> -o <output.iso> [OPTIONS]\n";
    std::cout << "       injectiso --extract-mbr -i <input.iso> -o <mbr.bin>\n";
    std::cout << "       injectiso --regenerate <tree> | --verify <tree>\n\n";
    std::cout << Colors::cyan("Options:") << "\n";
    std::cout << "  -i <file>          Input installer image (.iso or .img)\n";
    std::cout << "  -o <file>          Output path, must not exist yet\n";
    std::cout << "  -n <name>          Volume name of the new image (default: Debian)\n";
    std::cout << "                     Allowed: letters, digits, ' ', '.', '_', '-'\n";
    std::cout << "  -a <arch>          install.<arch> directory holding the initrd\n";
    std::cout << "                     (default: guessed from the image name)\n";
    std::cout << "  -d <dist>          Distribution codename for preseed placeholders\n";
    std::cout << "  -f <dir>           Overlay directory copied onto the image\n";
    std::cout << "  -j <src>:<dest>    Add file <src> to the initrd as <dest> (repeatable)\n";
    std::cout << "  -x                 Name appended initrd files by absolute path\n";
    std::cout << "  --profile <name>   Edit profile: debian (default) or none\n";
    std::cout << "  --dry-run          Show the plan without touching anything\n";
    std::cout << "  --verbose          Show debug output and tool invocations\n";
    std::cout << "  --no-color         Disable colored output\n";
    std::cout << "  -v                 Show version information\n";
    std::cout << "  -h                 Show this help message\n\n";

    std::cout << Colors::bold("Examples:") << "\n";
    std::cout << "  injectiso -i debian-12.5.0-amd64-netinst.iso -o custom.iso -f ./files_to_inject\n";
    std::cout << "  injectiso -i debian.iso -o out.iso --profile none -a amd -j preseed.cfg:preseed.cfg\n";
    std::cout << "  injectiso --verify /tmp/extracted-iso\n\n";

    std::cout << Colors::yellow("Note: ") << "xorriso and cpio must be installed "
              << "(override with INJECTISO_XORRISO / INJECTISO_CPIO)\n";
}

bool parseInjection(const std::string& arg, Injection::InitrdInjection& injection) {
    size_t separator = arg.rfind(':');
    if (separator == std::string::npos || separator == 0 || separator + 1 == arg.size()) {
        return false;
    }

    injection.sourceFile = arg.substr(0, separator);
    injection.targetPath = arg.substr(separator + 1);
    return true;
}

bool parseArguments(int argc, char* argv[], Options& opts) {
    int opt;

    static struct option long_options[] = {
        {"dry-run", no_argument, 0, 'D'},
        {"verbose", no_argument, 0, 'V'},
        {"no-color", no_argument, 0, 'C'},
        {"profile", required_argument, 0, 'P'},
        {"extract-mbr", no_argument, 0, 'M'},
        {"regenerate", required_argument, 0, 'R'},
        {"verify", required_argument, 0, 'K'},
        {0, 0, 0, 0}
    };

    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "i:o:n:a:d:f:j:xvh", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'i':
                opts.inputPath = optarg;
                break;
            case 'o':
                opts.outputPath = optarg;
                break;
            case 'n':
                opts.filesystemName = optarg;
                break;
            case 'a':
                opts.arch = optarg;
                break;
            case 'd':
                opts.dist = optarg;
                break;
            case 'f':
                opts.overlayDir = optarg;
                break;
            case 'j': {
                Injection::InitrdInjection injection;
                if (!parseInjection(optarg, injection)) {
                    Logs::error("Invalid injection '" + std::string(optarg) + "', expected <src>:<dest>");
                    return false;
                }
                opts.injections.push_back(injection);
                break;
            }
            case 'x':
                opts.absolutePatchMode = true;
                break;
            case 'P': {
                std::string profile = optarg;
                std::transform(profile.begin(), profile.end(), profile.begin(), ::tolower);
                if (profile != "debian" && profile != "none") {
                    Logs::error("Unknown profile '" + profile + "'. Use 'debian' or 'none'");
                    return false;
                }
                opts.profile = profile;
                break;
            }
            case 'M':
                opts.mode = Mode::EXTRACT_MBR;
                break;
            case 'R':
                opts.mode = Mode::REGENERATE;
                opts.treePath = optarg;
                break;
            case 'K':
                opts.mode = Mode::VERIFY;
                opts.treePath = optarg;
                break;
            case 'D':
                opts.dryRun = true;
                break;
            case 'V':
                Logs::setVerbose(true);
                break;
            case 'C':
                Colors::setEnabled(false);
                break;
            case 'v':
                Version::printVersion();
                exit(0);
            case 'h':
                printUsage();
                exit(0);
            default:
                return false;
        }
    }

    if (optind < argc) {
        Logs::error("Unexpected argument: " + std::string(argv[optind]));
        return false;
    }

    if ((opts.mode == Mode::INJECT || opts.mode == Mode::EXTRACT_MBR) &&
        (opts.inputPath.empty() || opts.outputPath.empty())) {
        Logs::error("Both -i (input image) and -o (output path) are required");
        return false;
    }

    if (opts.profile == "none" && !opts.overlayDir.empty()) {
        Logs::error("-f (overlay) is only used by the debian profile");
        return false;
    }

    return true;
}

Injection::InjectionPlan buildPlan(const Options& opts) {
    Injection::InjectionPlan plan;
    plan.inputImage = opts.inputPath;
    plan.outputImage = opts.outputPath;
    plan.filesystemName = opts.filesystemName;
    plan.patchMode = opts.absolutePatchMode ?
        InitrdPatcher::PatchMode::ABSOLUTE_PATH : InitrdPatcher::PatchMode::RELATIVE_TO_BASE;

    if (opts.profile == "debian") {
        DebianProfile::Tokens tokens = DebianProfile::detectTokens(opts.inputPath, opts.arch, opts.dist);
        Logs::info("Architecture: " + tokens.arch + ", distribution: " + tokens.dist);
        DebianProfile::applyToPlan(plan, tokens, opts.overlayDir);
    } else {
        plan.arch = opts.arch;
    }

    plan.initrdInjections.insert(plan.initrdInjections.end(),
                                 opts.injections.begin(), opts.injections.end());
    return plan;
}

void showDryRunInfo(const Injection::InjectionPlan& plan) {
    std::cout << "\n" << Colors::bold(Colors::cyan("=== DRY RUN MODE - NO CHANGES WILL BE MADE ===")) << "\n\n";

    std::cout << Colors::bold("Images:") << "\n";
    std::cout << "  Input:  " << plan.inputImage << "\n";
    std::cout << "  Output: " << plan.outputImage << "\n";
    std::cout << "  Volume: " << plan.filesystemName << "\n\n";

    std::cout << Colors::bold("Planned Operations:") << "\n";
    int step = 1;
    std::cout << "  " << step++ << ". Extract image tree and MBR data\n";
    for (const auto& edit : plan.treeEdits) {
        std::cout << "  " << step++ << ". " << edit.describe() << "\n";
    }
    for (const auto& injection : plan.initrdInjections) {
        std::cout << "  " << step++ << ". Append " << injection.sourceFile << " to "
                  << Injection::initrdPathFor(plan.arch) << " as " << injection.targetPath << "\n";
    }
    std::cout << "  " << step++ << ". Regenerate " << ChecksumManifest::MANIFEST_NAME << "\n";
    std::cout << "  " << step++ << ". Repack hybrid image\n\n";

    std::cout << Colors::bold("Tools:") << "\n";
    std::string xorriso = ISOExtractor::xorrisoTool();
    std::string cpio = InitrdPatcher::cpioTool();
    std::cout << "  " << xorriso << ": "
              << (ProcessRunner::isAvailable(xorriso) ? Colors::green("found") : Colors::red("missing")) << "\n";
    std::cout << "  " << cpio << ": "
              << (ProcessRunner::isAvailable(cpio) ? Colors::green("found") : Colors::red("missing")) << "\n\n";

    std::cout << Colors::yellow("Remove --dry-run flag to perform the actual operation.") << "\n\n";
}

int runVerify(const std::string& tree) {
    ChecksumManifest::VerifyReport report = ChecksumManifest::verify(tree);

    for (const auto& path : report.mismatched) {
        Logs::error("Checksum mismatch: " + path);
    }
    for (const auto& path : report.missing) {
        Logs::error("Missing file: " + path);
    }
    for (const auto& path : report.unlisted) {
        Logs::warning("Not listed in manifest: " + path);
    }

    if (!report.ok()) {
        Logs::fatal("Verification failed for " + tree);
        return 1;
    }

    Logs::success(std::to_string(report.checked) + " files verified");
    return 0;
}

int main(int argc, char* argv[]) {
    Options opts;

    try {
        if (argc < 2) {
            printUsage();
            return 2;
        }

        if (!parseArguments(argc, argv, opts)) {
            printUsage();
            return 2;
        }

        Version::printBanner();

        switch (opts.mode) {
            case Mode::EXTRACT_MBR:
                MBRExtractor::extractMBR(opts.inputPath, opts.outputPath);
                Logs::success("MBR data written to " + opts.outputPath);
                return 0;

            case Mode::REGENERATE:
                Logs::info("Regenerating MD5 checksums...");
                ChecksumManifest::regenerate(opts.treePath);
                Logs::success("MD5 calculations complete.");
                return 0;

            case Mode::VERIFY:
                return runVerify(opts.treePath);

            case Mode::INJECT:
                break;
        }

        Injection::InjectionPlan plan = buildPlan(opts);
        Injection::validatePlan(plan);

        if (opts.dryRun) {
            showDryRunInfo(plan);
            return 0;
        }

        Injection::injectFilesIntoISO(plan);

        std::cout << "\n" << Colors::green(Colors::bold("✓ SUCCESS!")) << std::endl;
        return 0;

    } catch (const ProcessError& e) {
        ErrorHandler::reportFatalError(e);
        return ErrorHandler::exitCodeFor(e);
    } catch (const InjectISOException& e) {
        ErrorHandler::reportFatalError(e);
        return ErrorHandler::exitCodeFor(e);
    } catch (const std::exception& e) {
        ErrorHandler::reportFatalError(e);
        return 1;
    }
}

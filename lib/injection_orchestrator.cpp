#include "lib/injection_orchestrator.hpp"
#include "lib/checksum_manifest.hpp"
#include "lib/iso_extractor.hpp"
#include "lib/iso_inspector.hpp"
#include "lib/iso_repacker.hpp"
#include "lib/mbr_extractor.hpp"
#include "lib/path_guard.hpp"
#include "lib/errors.hpp"
#include "utils/file_utils.hpp"
#include "utils/logs.hpp"
#include <filesystem>

namespace fs = std::filesystem;

namespace Injection {
    
    std::string initrdPathFor(const std::string& arch) {
        return "install." + arch + "/gtk/" + InitrdPatcher::INITRD_NAME;
    }
    
    void validatePlan(const InjectionPlan& plan) {
        fs::path input = PathGuard::require(plan.inputImage, PathGuard::Requirement::EXISTING_FILE);
        if (!MBRExtractor::hasImageExtension(input.string())) {
            throw InvalidFormatError(input.string(), "Input file is not an image file");
        }
        
        PathGuard::require(plan.outputImage, PathGuard::Requirement::NON_EXISTING);
        PathGuard::require(plan.outputImage, PathGuard::Requirement::EXISTING_PARENT);
        
        ISORepacker::validateFilesystemName(plan.filesystemName);
        
        if (!plan.initrdInjections.empty() && plan.arch.empty()) {
            throw InvalidArgumentError("An architecture is needed to locate the initrd");
        }
        
        for (const auto& injection : plan.initrdInjections) {
            PathGuard::require(injection.sourceFile, PathGuard::Requirement::EXISTING_FILE);
            // throws on absolute or escaping target paths
            TreeEditor::resolveInside("/", injection.targetPath);
        }
        
        for (const auto& edit : plan.treeEdits) {
            if (edit.kind == TreeEditor::EditKind::COPY_OVERLAY) {
                PathGuard::require(edit.sourceDir, PathGuard::Requirement::EXISTING_DIRECTORY);
            }
        }
    }
    
    static void stageInjection(const fs::path& stagingDir, const InitrdInjection& injection) {
        fs::path source = PathGuard::require(injection.sourceFile, PathGuard::Requirement::EXISTING_FILE);
        fs::path destination = TreeEditor::resolveInside(stagingDir, injection.targetPath);
        
        std::error_code ec;
        fs::create_directories(destination.parent_path(), ec);
        if (ec) {
            throw FilesystemError("Cannot create " + destination.parent_path().string() + ": " + ec.message());
        }
        
        fs::copy_file(source, destination, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            throw FilesystemError("Cannot stage " + source.string() + ": " + ec.message());
        }
    }
    
    void injectFilesIntoISO(const InjectionPlan& plan) {
        validatePlan(plan);
        
        fs::path input = PathGuard::resolve(plan.inputImage);
        fs::path output = PathGuard::resolve(plan.outputImage);
        
        ISOInspector::ImageInfo info = ISOInspector::inspect(input.string());
        Logs::info("Input image type: " + ISOInspector::describe(info.type));
        if (!info.hasMBRSignature) {
            Logs::warning("Input image has no MBR signature, the repacked image may not boot from USB");
        }
        
        // Destroyed in reverse order on every exit path
        FileUtils::TempDirectory extractedTree("injectiso-tree-");
        FileUtils::TempDirectory mbrDir("injectiso-mbr-");
        
        Logs::info("Extracting contents of " + input.filename().string() + "...");
        ISOExtractor::extract(input.string(), extractedTree.path().string());
        Logs::success("ISO extraction complete.");
        
        Logs::info("Extracting MBR from " + input.filename().string() + "...");
        fs::path mbrFile = mbrDir / "mbr.bin";
        MBRExtractor::extractMBR(input.string(), mbrFile.string());
        Logs::success("MBR extraction complete.");
        
        if (!plan.treeEdits.empty()) {
            Logs::info("Applying " + std::to_string(plan.treeEdits.size()) + " tree edits...");
            TreeEditor::apply(extractedTree.path().string(), plan.treeEdits);
            Logs::success("Tree edits complete.");
        }
        
        if (!plan.initrdInjections.empty()) {
            fs::path initrd = extractedTree / initrdPathFor(plan.arch);
            Logs::info("Appending " + std::to_string(plan.initrdInjections.size()) + 
                      " files to " + initrdPathFor(plan.arch) + "...");
            
            FileUtils::TempDirectory fileStaging("injectiso-files-");
            for (const auto& injection : plan.initrdInjections) {
                stageInjection(fileStaging.path(), injection);
                InitrdPatcher::appendFile(initrd.string(), fileStaging.path().string(), 
                                          injection.targetPath, plan.patchMode);
                Logs::debug("Injected " + injection.sourceFile + " as " + injection.targetPath);
            }
            Logs::success("Initrd patching complete.");
        }
        
        Logs::info("Regenerating MD5 checksums...");
        ChecksumManifest::regenerate(extractedTree.path().string());
        Logs::success("MD5 calculations complete.");
        
        Logs::info("Repacking ISO...");
        ISORepacker::repack(output.string(), mbrFile.string(), 
                            extractedTree.path().string(), plan.filesystemName);
        Logs::success("ISO file was created successfully at '" + output.string() + "'.");
    }
}

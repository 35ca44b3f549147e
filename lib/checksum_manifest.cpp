#include "lib/checksum_manifest.hpp"
#include "lib/path_guard.hpp"
#include "lib/errors.hpp"
#include "utils/file_utils.hpp"
#include "utils/progress_bar.hpp"
#include "utils/logs.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <fstream>
#include <memory>
#include <set>
#include <cstdio>
#include <cstring>
#include <cerrno>

namespace fs = std::filesystem;

namespace ChecksumManifest {
    
    const std::string MANIFEST_NAME = "md5sum.txt";
    
    static const size_t DIGEST_HEX_LENGTH = 32;
    static const size_t READ_CHUNK = 1024 * 1024;
    
    struct MDCtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };
    using UniqueMDCtx = std::unique_ptr<EVP_MD_CTX, MDCtxDeleter>;
    
    static std::string hexEncode(const unsigned char* data, size_t len) {
        static const char HEX[] = "0123456789abcdef";
        std::string out;
        out.reserve(len * 2);
        for (size_t i = 0; i < len; i++) {
            out.push_back(HEX[(data[i] >> 4) & 0x0F]);
            out.push_back(HEX[data[i] & 0x0F]);
        }
        return out;
    }
    
    static bool isHexDigest(const std::string& text) {
        if (text.size() != DIGEST_HEX_LENGTH) {
            return false;
        }
        return std::all_of(text.begin(), text.end(), [](char c) {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        });
    }
    
    static void collectFiles(const fs::path& dir, std::vector<fs::path>& files) {
        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            throw FilesystemError("Cannot list " + dir.string() + ": " + ec.message());
        }
        
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            fs::file_status status = it->symlink_status(ec);
            if (ec) {
                throw FilesystemError("Cannot stat " + it->path().string() + ": " + ec.message());
            }
            
            if (fs::is_regular_file(status)) {
                files.push_back(it->path());
            } else if (fs::is_directory(status)) {
                collectFiles(it->path(), files);
            }
        }
        if (ec) {
            throw FilesystemError("Cannot list " + dir.string() + ": " + ec.message());
        }
    }
    
    std::vector<fs::path> findAllFilesUnder(const fs::path& root) {
        fs::path dir = PathGuard::require(root.string(), PathGuard::Requirement::EXISTING_DIRECTORY);
        
        std::vector<fs::path> files;
        collectFiles(dir, files);
        return files;
    }
    
    std::string md5Hex(const fs::path& file) {
        std::ifstream in(file, std::ios::binary);
        if (!in.is_open()) {
            throw FilesystemError("Cannot open " + file.string() + " for hashing");
        }
        
        UniqueMDCtx ctx(EVP_MD_CTX_new());
        if (!ctx) {
            throw FilesystemError("Digest context allocation failed");
        }
        if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
            throw FilesystemError("MD5 digest init failed");
        }
        
        std::vector<char> buffer(READ_CHUNK);
        while (in) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            std::streamsize n = in.gcount();
            if (n > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(n)) != 1) {
                throw FilesystemError("MD5 digest update failed for " + file.string());
            }
        }
        if (in.bad()) {
            throw FilesystemError("Failed reading " + file.string());
        }
        
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int digestLength = 0;
        if (EVP_DigestFinal_ex(ctx.get(), digest, &digestLength) != 1) {
            throw FilesystemError("MD5 digest final failed for " + file.string());
        }
        
        return hexEncode(digest, digestLength);
    }
    
    std::string formatLine(const Entry& entry) {
        // two spaces: the md5sum "text mode" separator installers expect
        return entry.digest + "  " + entry.path + "\n";
    }
    
    std::vector<Entry> buildEntries(const fs::path& root) {
        fs::path dir = PathGuard::require(root.string(), PathGuard::Requirement::EXISTING_DIRECTORY);
        std::vector<fs::path> files = findAllFilesUnder(dir);
        
        std::vector<Entry> entries;
        entries.reserve(files.size());
        
        ProgressBar progress(files.size(), "Hashing");
        uintmax_t totalBytes = 0;
        
        for (const auto& file : files) {
            std::string relative = file.lexically_relative(dir).generic_string();
            if (relative == MANIFEST_NAME) {
                progress.advance();
                continue;
            }
            
            std::error_code ec;
            uintmax_t size = fs::file_size(file, ec);
            if (!ec) totalBytes += size;
            
            entries.push_back({md5Hex(file), relative});
            progress.advance();
        }
        progress.finish();
        
        std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
            return a.path < b.path;
        });
        
        Logs::debug("Hashed " + std::to_string(entries.size()) + " files (" + 
                   ProgressBar::formatSize(static_cast<size_t>(totalBytes)) + ")");
        return entries;
    }
    
    void regenerate(const std::string& treeRoot) {
        fs::path root = PathGuard::require(treeRoot, PathGuard::Requirement::EXISTING_DIRECTORY);
        fs::path manifest = root / MANIFEST_NAME;
        
        std::vector<Entry> entries = buildEntries(root);
        
        std::string content;
        for (const auto& entry : entries) {
            content += formatLine(entry);
        }
        
        FileUtils::ScopedPermissions rootPerms(root, static_cast<fs::perms>(0755), 
                                               static_cast<fs::perms>(0555));
        
        // Released before rootPerms, so the manifest is read-only again
        // before its directory is
        std::unique_ptr<FileUtils::ScopedPermissions> manifestPerms;
        std::error_code ec;
        if (fs::exists(fs::symlink_status(manifest, ec))) {
            manifestPerms = std::make_unique<FileUtils::ScopedPermissions>(
                manifest, static_cast<fs::perms>(0644), static_cast<fs::perms>(0444));
        }
        
        fs::path partial = root / ("." + MANIFEST_NAME + ".partial");
        try {
            FileUtils::writeFile(partial, content);
        } catch (const InjectISOException&) {
            fs::remove(partial, ec);
            throw;
        }
        
        if (std::rename(partial.c_str(), manifest.c_str()) != 0) {
            int err = errno;
            fs::remove(partial, ec);
            throw FilesystemError("Cannot replace " + manifest.string() + ": " + strerror(err));
        }
        
        if (!manifestPerms) {
            fs::permissions(manifest, static_cast<fs::perms>(0444), fs::perm_options::replace, ec);
            if (ec) {
                throw FilesystemError("Cannot make " + manifest.string() + " read-only: " + ec.message());
            }
        }
        
        Logs::debug("Wrote " + std::to_string(entries.size()) + " entries to " + manifest.string());
    }
    
    std::vector<Entry> parse(const std::string& manifestFile) {
        fs::path manifest = PathGuard::require(manifestFile, PathGuard::Requirement::EXISTING_FILE);
        
        std::ifstream in(manifest);
        if (!in.is_open()) {
            throw NotFoundError(manifest.string(), "Cannot open manifest");
        }
        
        std::vector<Entry> entries;
        std::string line;
        size_t lineNumber = 0;
        
        while (std::getline(in, line)) {
            lineNumber++;
            if (line.empty()) continue;
            
            if (line.size() < DIGEST_HEX_LENGTH + 3 || 
                line.compare(DIGEST_HEX_LENGTH, 2, "  ") != 0) {
                throw InvalidFormatError(manifest.string(), 
                    "Malformed manifest line " + std::to_string(lineNumber));
            }
            
            Entry entry;
            entry.digest = line.substr(0, DIGEST_HEX_LENGTH);
            entry.path = line.substr(DIGEST_HEX_LENGTH + 2);
            
            if (!isHexDigest(entry.digest)) {
                throw InvalidFormatError(manifest.string(), 
                    "Bad digest on manifest line " + std::to_string(lineNumber));
            }
            entries.push_back(entry);
        }
        
        return entries;
    }
    
    VerifyReport verify(const std::string& treeRoot) {
        fs::path root = PathGuard::require(treeRoot, PathGuard::Requirement::EXISTING_DIRECTORY);
        std::vector<Entry> entries = parse((root / MANIFEST_NAME).string());
        
        VerifyReport report;
        std::set<std::string> listed;
        
        for (const auto& entry : entries) {
            listed.insert(entry.path);
            fs::path file = root / entry.path;
            
            std::error_code ec;
            if (!fs::is_regular_file(fs::symlink_status(file, ec))) {
                report.missing.push_back(entry.path);
                continue;
            }
            
            report.checked++;
            if (md5Hex(file) != entry.digest) {
                report.mismatched.push_back(entry.path);
            }
        }
        
        for (const auto& file : findAllFilesUnder(root)) {
            std::string relative = file.lexically_relative(root).generic_string();
            if (relative != MANIFEST_NAME && listed.count(relative) == 0) {
                report.unlisted.push_back(relative);
            }
        }
        
        return report;
    }
}

#ifndef CHECKSUM_MANIFEST_HPP
#define CHECKSUM_MANIFEST_HPP

#include <string>
#include <vector>
#include <filesystem>

namespace ChecksumManifest {
    
    extern const std::string MANIFEST_NAME;
    
    struct Entry {
        std::string digest;         // 32 lowercase hex characters
        std::string path;           // relative to the tree root, '/' separated
    };
    
    struct VerifyReport {
        size_t checked = 0;
        std::vector<std::string> mismatched;
        std::vector<std::string> missing;
        std::vector<std::string> unlisted;
        
        bool ok() const { return mismatched.empty() && missing.empty(); }
    };
    
    // Regular files anywhere below root. Symlinks are skipped, whether they
    // point at files or directories, so nothing behind a symlinked directory
    // is reached. The order is the directory iteration order.
    std::vector<std::filesystem::path> findAllFilesUnder(const std::filesystem::path& root);
    
    std::string md5Hex(const std::filesystem::path& file);
    
    std::string formatLine(const Entry& entry);
    
    // One entry per file below root except the manifest itself, sorted by path.
    std::vector<Entry> buildEntries(const std::filesystem::path& root);
    
    // Rewrites <treeRoot>/md5sum.txt from the current tree content. The old
    // manifest is only replaced once every digest has been computed. The
    // manifest is left 0444 and treeRoot 0555.
    //
    // Not safe to run concurrently on the same tree.
    void regenerate(const std::string& treeRoot);
    
    std::vector<Entry> parse(const std::string& manifestFile);
    
    // Re-hashes everything listed in <treeRoot>/md5sum.txt.
    VerifyReport verify(const std::string& treeRoot);
}

#endif // CHECKSUM_MANIFEST_HPP

#ifndef TREE_EDITOR_HPP
#define TREE_EDITOR_HPP

#include <string>
#include <vector>
#include <filesystem>

namespace TreeEditor {
    
    enum class EditKind {
        SUBSTITUTE,         // replace placeholder with value in target files
        DELETE_SUBTREE,     // remove path and everything below it
        COPY_OVERLAY        // copy sourceDir onto the tree, overwriting files
    };
    
    struct TreeEdit {
        EditKind kind;
        std::string placeholder;
        std::string value;
        std::vector<std::string> targets;   // files, or directories meaning their direct files
        std::string path;
        std::string sourceDir;
        
        static TreeEdit substitute(const std::string& placeholder, const std::string& value,
                                   const std::vector<std::string>& targets);
        static TreeEdit deleteSubtree(const std::string& path);
        static TreeEdit copyOverlay(const std::string& sourceDir);
        
        std::string describe() const;
    };
    
    // root/relative, refusing absolute paths and anything that climbs out of root.
    std::filesystem::path resolveInside(const std::filesystem::path& root, const std::string& relative);
    
    // Returns the number of replacements made.
    size_t applySubstitute(const std::filesystem::path& root, const TreeEdit& edit);
    
    // Returns false when there was nothing to delete.
    bool applyDelete(const std::filesystem::path& root, const TreeEdit& edit);
    
    // Returns the number of files copied.
    size_t applyOverlay(const std::filesystem::path& root, const TreeEdit& edit);
    
    // Runs the edits in order. Write permission is granted only to the paths
    // an edit touches and taken back when the edit is done, failed or not.
    void apply(const std::string& treeRoot, const std::vector<TreeEdit>& edits);
}

#endif // TREE_EDITOR_HPP

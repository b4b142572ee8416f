#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sprig::aot {

/**
 * @brief Sink for everything AOT processing produces
 *
 * Paths are relative, '/'-separated and unique per kind.
 */
class GeneratedFiles {
public:
    enum class Kind { SOURCE, RESOURCE };

    virtual ~GeneratedFiles() = default;

    void add_source_file(const std::string& path, std::string content) {
        add_file(Kind::SOURCE, path, std::move(content));
    }
    void add_resource_file(const std::string& path, std::string content) {
        add_file(Kind::RESOURCE, path, std::move(content));
    }

    // Throws AotProcessingError for a duplicate or malformed path
    virtual void add_file(Kind kind, const std::string& path,
                          std::string content) = 0;
    virtual bool contains(Kind kind, const std::string& path) const = 0;

    static std::string kind_to_string(Kind kind);
};

class InMemoryGeneratedFiles : public GeneratedFiles {
public:
    struct File {
        Kind kind;
        std::string path;
        std::string content;
    };

    void add_file(Kind kind, const std::string& path,
                  std::string content) override;
    bool contains(Kind kind, const std::string& path) const override;

    std::optional<std::string> content(Kind kind,
                                       const std::string& path) const;
    // Insertion order
    const std::vector<File>& files() const { return files_; }
    std::size_t size() const { return files_.size(); }
    bool empty() const { return files_.empty(); }

private:
    std::vector<File> files_;
    std::map<std::pair<Kind, std::string>, std::size_t> index_;
};

/**
 * @brief Collects files in memory and publishes them all at once
 *
 * commit() writes the complete tree (sources/, resources/ and a
 * manifest.json listing every file) into a sibling staging directory and
 * then swaps it with the output root through directory renames. A reader
 * of the root sees either the previous tree or the new one, never a mix.
 *
 * Files listed in the previous manifest.json are replaced; anything else
 * already under the root is carried into the new tree. Generating a path
 * that holds such an unmanaged file fails with PersistenceError.
 */
class FileSystemGeneratedFiles : public InMemoryGeneratedFiles {
public:
    static constexpr const char* MANIFEST_FILE = "manifest.json";

    explicit FileSystemGeneratedFiles(std::filesystem::path root);

    const std::filesystem::path& root() const { return root_; }
    static std::string directory_for(Kind kind);
    std::filesystem::path path_for(Kind kind, const std::string& path) const;

    // Throws PersistenceError; the staging directory never survives a failure
    std::vector<std::filesystem::path> commit();
    bool is_committed() const { return committed_; }

private:
    std::filesystem::path root_;
    bool committed_ = false;
};

}  // namespace sprig::aot

#include "sprig/aot/generated_files.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <set>
#include <system_error>

#include "sprig/aot/exceptions.hpp"
#include "sprig/log/logger.hpp"

namespace fs = std::filesystem;

namespace sprig::aot {

namespace {

void check_relative_path(const std::string& path) {
    if (path.empty()) {
        throw AotProcessingError("Generated file path must not be empty");
    }
    fs::path candidate(path);
    if (candidate.is_absolute() || path.front() == '/') {
        throw AotProcessingError("Generated file path must be relative: " +
                                 path);
    }
    for (const auto& part : candidate) {
        if (part == "..") {
            throw AotProcessingError(
                "Generated file path must not leave the output root: " + path);
        }
    }
}

void write_file(const fs::path& target, const std::string& content) {
    fs::create_directories(target.parent_path());
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw PersistenceError("Cannot open " + target.string() +
                               " for writing");
    }
    out << content;
    out.close();
    if (!out) {
        throw PersistenceError("Failed to write " + target.string());
    }
}

void remove_quietly(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        SPRIG_LOG_WARN << "Could not remove " << path.string() << ": "
                       << ec.message();
    }
}

// Paths (relative to root) that the previous commit generated
std::set<std::string> previously_generated(const fs::path& root,
                                           const char* manifest_file) {
    std::set<std::string> generated;
    const fs::path manifest_path = root / manifest_file;
    if (!fs::exists(manifest_path)) {
        return generated;
    }
    std::ifstream in(manifest_path);
    nlohmann::json manifest;
    try {
        in >> manifest;
        for (const auto& file : manifest.at("files")) {
            generated.insert(file.at("path").get<std::string>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw PersistenceError("Unreadable manifest " + manifest_path.string() +
                               ": " + e.what());
    }
    return generated;
}

// Copies everything under root that the previous commit did not generate
// into staging. An unmanaged file never gets overwritten by generated output.
void carry_over_unmanaged(const fs::path& root, const fs::path& staging,
                          const std::set<std::string>& staged,
                          const char* manifest_file) {
    if (!fs::is_directory(root)) {
        throw PersistenceError("Output root " + root.string() +
                               " exists and is not a directory");
    }
    const auto generated = previously_generated(root, manifest_file);
    std::set<std::string> generated_dirs;
    for (const auto& path : generated) {
        for (fs::path dir = fs::path(path).parent_path(); !dir.empty();
             dir = dir.parent_path()) {
            generated_dirs.insert(dir.generic_string());
        }
    }

    for (auto it = fs::recursive_directory_iterator(root);
         it != fs::recursive_directory_iterator(); ++it) {
        const fs::path relative = it->path().lexically_relative(root);
        const std::string key = relative.generic_string();
        if (key == manifest_file || generated.count(key) > 0) {
            continue;
        }
        const fs::path target = staging / relative;
        if (it->is_directory() && !it->is_symlink()) {
            // sources/, resources/ and friends come back with the new files
            if (generated_dirs.count(key) == 0) {
                fs::create_directories(target);
            }
            continue;
        }
        if (staged.count(key) > 0) {
            throw PersistenceError("Refusing to overwrite " +
                                   it->path().string() +
                                   ", which was not generated by a previous "
                                   "run");
        }
        fs::create_directories(target.parent_path());
        if (it->is_symlink()) {
            fs::copy_symlink(it->path(), target);
        } else {
            fs::copy_file(it->path(), target);
        }
        SPRIG_LOG_TRACE << "Kept unmanaged file " << key;
    }
}

}  // namespace

std::string GeneratedFiles::kind_to_string(Kind kind) {
    return kind == Kind::SOURCE ? "source" : "resource";
}

void InMemoryGeneratedFiles::add_file(Kind kind, const std::string& path,
                                      std::string content) {
    check_relative_path(path);
    auto key = std::make_pair(kind, path);
    if (index_.count(key)) {
        throw AotProcessingError("Duplicate generated " +
                                 kind_to_string(kind) + " file: " + path);
    }
    index_.emplace(std::move(key), files_.size());
    files_.push_back(File{kind, path, std::move(content)});
    SPRIG_LOG_TRACE << "Added generated " << kind_to_string(kind)
                    << " file " << path;
}

bool InMemoryGeneratedFiles::contains(Kind kind,
                                      const std::string& path) const {
    return index_.count(std::make_pair(kind, path)) > 0;
}

std::optional<std::string> InMemoryGeneratedFiles::content(
    Kind kind, const std::string& path) const {
    auto it = index_.find(std::make_pair(kind, path));
    if (it == index_.end()) return std::nullopt;
    return files_[it->second].content;
}

FileSystemGeneratedFiles::FileSystemGeneratedFiles(fs::path root)
    : root_(std::move(root)) {
    if (root_.empty()) {
        throw PersistenceError("Output directory must not be empty");
    }
    // Normalise away a trailing separator so the sibling names are right
    if (!root_.has_filename()) root_ = root_.parent_path();
}

std::string FileSystemGeneratedFiles::directory_for(Kind kind) {
    return kind == Kind::SOURCE ? "sources" : "resources";
}

fs::path FileSystemGeneratedFiles::path_for(Kind kind,
                                            const std::string& path) const {
    return root_ / directory_for(kind) / fs::path(path);
}

std::vector<fs::path> FileSystemGeneratedFiles::commit() {
    if (committed_) {
        throw PersistenceError("Generated files were already committed to " +
                               root_.string());
    }

    const fs::path staging = root_.parent_path() /
                             (root_.filename().string() + ".sprig-staging");
    const fs::path previous = root_.parent_path() /
                              (root_.filename().string() + ".sprig-previous");
    std::vector<fs::path> written;

    SPRIG_LOG_DEBUG << "Staging " << files().size() << " generated files in "
                    << staging.string();
    try {
        remove_quietly(staging);
        fs::create_directories(staging);

        nlohmann::ordered_json manifest;
        manifest["files"] = nlohmann::ordered_json::array();
        std::set<std::string> staged;
        for (const auto& file : files()) {
            fs::path relative = fs::path(directory_for(file.kind)) / file.path;
            write_file(staging / relative, file.content);
            written.push_back(root_ / relative);
            staged.insert(relative.generic_string());
            manifest["files"].push_back(
                {{"kind", kind_to_string(file.kind)},
                 {"path", relative.generic_string()}});
        }
        write_file(staging / MANIFEST_FILE, manifest.dump(2) + "\n");

        if (fs::exists(root_)) {
            carry_over_unmanaged(root_, staging, staged, MANIFEST_FILE);
        }

        // Swap the staged tree into place
        remove_quietly(previous);
        bool had_previous = fs::exists(root_);
        if (had_previous) {
            fs::rename(root_, previous);
        }
        try {
            fs::rename(staging, root_);
        } catch (const fs::filesystem_error&) {
            if (had_previous) {
                std::error_code ec;
                fs::rename(previous, root_, ec);
                if (ec) {
                    SPRIG_LOG_ERROR << "Could not restore previous output "
                                    << previous.string() << ": "
                                    << ec.message();
                }
            }
            throw;
        }
        if (had_previous) remove_quietly(previous);
    } catch (const PersistenceError& e) {
        SPRIG_LOG_ERROR << "Persisting generated files failed: " << e.what();
        remove_quietly(staging);
        throw;
    } catch (const std::exception& e) {
        SPRIG_LOG_ERROR << "Persisting generated files failed: " << e.what();
        remove_quietly(staging);
        throw PersistenceError("Failed to persist generated files to " +
                               root_.string() + ": " + e.what());
    }

    committed_ = true;
    SPRIG_LOG_INFO << "Wrote " << written.size() << " generated files to "
                   << root_.string();
    return written;
}

}  // namespace sprig::aot

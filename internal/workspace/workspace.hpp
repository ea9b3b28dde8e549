#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace pano::workspace {

// Owns a transient working folder and removes it recursively on destruction.
class ScopedWorkDir {
 public:
  explicit ScopedWorkDir(std::filesystem::path dir);
  ~ScopedWorkDir();

  ScopedWorkDir(const ScopedWorkDir&)            = delete;
  ScopedWorkDir& operator=(const ScopedWorkDir&) = delete;

  ScopedWorkDir(ScopedWorkDir&& other) noexcept;
  ScopedWorkDir& operator=(ScopedWorkDir&&) = delete;

  const std::filesystem::path& Path() const {
    return dir_;
  }

 private:
  std::filesystem::path dir_;
};

struct WorkspaceLayout {
  std::string              project_dir   = ".pano";
  std::string              artifact_name = "bursts.pb";
  std::vector<std::string> raw_extensions{".raw", ".nef"};
};

/*
  A working directory of RAW captures.

    <root>/<id>.nef, .raw   sources
    <root>/Jpeg/            developed frames
    <root>/Panoramas/       stitched outputs
    <root>/Trash/           discarded sources
    <root>/<project_dir>/   persisted bursts + per-run working folders
*/
class Workspace {
 public:
  // Throws util::NotFound when root is not a directory. Creates the output folders.
  static Workspace Open(const std::filesystem::path& root, WorkspaceLayout layout = {});

  const std::filesystem::path& Root() const {
    return root_;
  }

  std::filesystem::path JpegDir() const;
  std::filesystem::path PanoramaDir() const;
  std::filesystem::path TrashDir() const;
  std::filesystem::path ProjectDir() const;
  std::filesystem::path ArtifactPath() const;

  bool IsRawFile(const std::filesystem::path& path) const;

  // RAW files directly in root, sorted by name. Throws util::InvalidState on duplicate stems.
  std::vector<std::filesystem::path> RawFiles() const;

  std::filesystem::path        JpegPath(const std::string& frame_id) const;
  static std::filesystem::path XmpPath(const std::filesystem::path& raw);

  // Fresh empty folder under the project folder, removed when the guard dies.
  ScopedWorkDir MakeWorkDir(std::string_view prefix) const;

 private:
  Workspace(std::filesystem::path root, WorkspaceLayout layout);

  std::filesystem::path root_;
  WorkspaceLayout       layout_;
};

} // namespace pano::workspace

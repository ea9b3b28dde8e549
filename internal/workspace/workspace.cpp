#include "workspace.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace pano::workspace {

using pano::observability::IntField;
using pano::observability::PathField;
using pano::observability::StringField;

namespace {

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

void EnsureDir(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw pano::util::InvalidState("cannot create " + dir.string() + ": " + ec.message());
  }
}

} // namespace

Workspace::Workspace(std::filesystem::path root, WorkspaceLayout layout) : root_(std::move(root)), layout_(std::move(layout)) {
  for (auto& ext : layout_.raw_extensions) {
    ext = Lower(ext);
    if (!ext.empty() && ext.front() != '.') ext.insert(ext.begin(), '.');
  }
}

Workspace Workspace::Open(const std::filesystem::path& root, WorkspaceLayout layout) {
  std::error_code ec;
  auto            resolved = std::filesystem::weakly_canonical(std::filesystem::absolute(root), ec);
  if (ec || !std::filesystem::is_directory(resolved)) {
    PANO_LOG_ERROR("Directory not found", {PathField("root", root)});
    throw pano::util::NotFound("directory not found: " + root.string());
  }

  Workspace ws(std::move(resolved), std::move(layout));
  EnsureDir(ws.JpegDir());
  EnsureDir(ws.PanoramaDir());
  EnsureDir(ws.TrashDir());
  EnsureDir(ws.ProjectDir());

  PANO_LOG_DEBUG("Workspace opened", {PathField("root", ws.root_), PathField("project_dir", ws.ProjectDir())});
  return ws;
}

std::filesystem::path Workspace::JpegDir() const {
  return root_ / "Jpeg";
}

std::filesystem::path Workspace::PanoramaDir() const {
  return root_ / "Panoramas";
}

std::filesystem::path Workspace::TrashDir() const {
  return root_ / "Trash";
}

std::filesystem::path Workspace::ProjectDir() const {
  return root_ / layout_.project_dir;
}

std::filesystem::path Workspace::ArtifactPath() const {
  return pano::storage::common::ArtifactPath(ProjectDir(), layout_.artifact_name);
}

bool Workspace::IsRawFile(const std::filesystem::path& path) const {
  const auto ext = Lower(path.extension().string());
  return std::find(layout_.raw_extensions.begin(), layout_.raw_extensions.end(), ext) != layout_.raw_extensions.end();
}

std::vector<std::filesystem::path> Workspace::RawFiles() const {
  std::vector<std::filesystem::path> paths;
  for (const auto& entry : std::filesystem::directory_iterator(root_)) {
    if (entry.is_regular_file() && IsRawFile(entry.path())) {
      paths.push_back(entry.path());
    }
  }
  std::sort(paths.begin(), paths.end());

  std::map<std::string, std::filesystem::path> by_stem;
  for (const auto& path : paths) {
    auto [it, inserted] = by_stem.emplace(path.stem().string(), path);
    if (!inserted) {
      PANO_LOG_ERROR("Duplicate file names found", {PathField("first", it->second), PathField("second", path)});
      throw pano::util::InvalidState("duplicate file name " + it->first + ": " + it->second.filename().string() + ", " +
                                     path.filename().string());
    }
  }

  PANO_LOG_INFO("Found raw images", {PathField("root", root_), IntField("count", static_cast<std::int64_t>(paths.size()))});
  return paths;
}

std::filesystem::path Workspace::JpegPath(const std::string& frame_id) const {
  return JpegDir() / (frame_id + ".jpg");
}

std::filesystem::path Workspace::XmpPath(const std::filesystem::path& raw) {
  return std::filesystem::path(raw.string() + ".xmp");
}

ScopedWorkDir Workspace::MakeWorkDir(std::string_view prefix) const {
  auto dir = ProjectDir() / pano::util::WorkFolderName(prefix);
  EnsureDir(dir);
  return ScopedWorkDir(std::move(dir));
}

ScopedWorkDir::ScopedWorkDir(std::filesystem::path dir) : dir_(std::move(dir)) {
}

ScopedWorkDir::ScopedWorkDir(ScopedWorkDir&& other) noexcept : dir_(std::move(other.dir_)) {
  other.dir_.clear();
}

ScopedWorkDir::~ScopedWorkDir() {
  if (dir_.empty()) {
    return;
  }

  std::error_code ec;
  std::filesystem::remove_all(dir_, ec);
  if (ec) {
    PANO_LOG_WARN("Failed to remove working folder", {PathField("path", dir_), StringField("error", ec.message())});
  }
}

} // namespace pano::workspace

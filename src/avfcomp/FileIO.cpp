#include "avfcomp/FileIO.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <istream>
#include <iterator>
#include <ostream>
#include <system_error>

#if defined(_WIN32)
  #ifndef NOMINMAX
    #define NOMINMAX
  #endif
  #ifndef WIN32_LEAN_AND_MEAN
    #define WIN32_LEAN_AND_MEAN
  #endif
  #include <windows.h>
#else
  #include <fcntl.h>
  #include <unistd.h>
#endif

namespace avfcomp {

namespace fs = std::filesystem;

namespace {

#if defined(_WIN32)

bool FlushPath(const fs::path& path, DWORD extraFlags, std::string& outError)
{
  HANDLE h = CreateFileW(path.wstring().c_str(),
                         GENERIC_READ | GENERIC_WRITE,
                         FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE,
                         nullptr,
                         OPEN_EXISTING,
                         FILE_ATTRIBUTE_NORMAL | extraFlags,
                         nullptr);
  if (h == INVALID_HANDLE_VALUE) {
    outError = "unable to open for sync: " + path.string() + " (error " + std::to_string(GetLastError()) + ")";
    return false;
  }
  const bool ok = FlushFileBuffers(h) != 0;
  if (!ok) {
    outError = "FlushFileBuffers failed: " + path.string() + " (error " + std::to_string(GetLastError()) + ")";
  }
  CloseHandle(h);
  return ok;
}

#else

bool FsyncPath(const fs::path& path, int flags, const char* what, std::string& outError)
{
  const int fd = ::open(path.c_str(), flags);
  if (fd < 0) {
    outError = std::string("unable to open ") + what + " for sync: " + path.string() + ": " + std::strerror(errno);
    return false;
  }
  if (::fsync(fd) != 0) {
    outError = std::string("fsync failed for ") + what + ": " + path.string() + ": " + std::strerror(errno);
    ::close(fd);
    return false;
  }
  ::close(fd);
  return true;
}

#endif

} // namespace

bool SyncFile(const fs::path& path, std::string& outError)
{
  outError.clear();
  if (path.empty()) {
    outError = "SyncFile path is empty";
    return false;
  }
#if defined(_WIN32)
  return FlushPath(path, 0, outError);
#else
  // Some filesystems refuse O_RDWR on freshly renamed files; fsync works on a
  // read-only descriptor too.
  return FsyncPath(path, O_RDONLY, "file", outError);
#endif
}

bool SyncDirectory(const fs::path& dir, std::string& outError)
{
  outError.clear();
  if (dir.empty()) {
    outError = "SyncDirectory path is empty";
    return false;
  }
#if defined(_WIN32)
  return FlushPath(dir, FILE_FLAG_BACKUP_SEMANTICS, outError);
#else
  int flags = O_RDONLY;
#ifdef O_DIRECTORY
  flags |= O_DIRECTORY;
#endif
  return FsyncPath(dir, flags, "directory", outError);
#endif
}

bool ReadFileBytes(const fs::path& path, std::vector<std::uint8_t>& out, CodecError& outError)
{
  out.clear();
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    return Fail(outError, ErrorCode::IoFailure, "unable to open for reading: " + path.string());
  }

  f.seekg(0, std::ios::end);
  const std::streamoff len = f.tellg();
  if (len < 0) {
    return Fail(outError, ErrorCode::IoFailure, "unable to determine size of: " + path.string());
  }
  f.seekg(0, std::ios::beg);

  out.resize(static_cast<std::size_t>(len));
  if (len > 0 && !f.read(reinterpret_cast<char*>(out.data()), len)) {
    out.clear();
    return Fail(outError, ErrorCode::IoFailure, "short read: " + path.string());
  }
  return true;
}

bool ReadStreamBytes(std::istream& in, std::vector<std::uint8_t>& out, CodecError& outError)
{
  out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  if (in.bad()) {
    out.clear();
    return Fail(outError, ErrorCode::IoFailure, "stream read failed");
  }
  return true;
}

bool WriteStreamBytes(std::ostream& out, const std::vector<std::uint8_t>& data, CodecError& outError)
{
  if (!data.empty()) out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  if (!out) return Fail(outError, ErrorCode::IoFailure, "stream write failed");
  return true;
}

bool WriteFileAtomic(const fs::path& path, const std::vector<std::uint8_t>& data, CodecError& outError)
{
  if (path.empty()) {
    return Fail(outError, ErrorCode::IoFailure, "output path is empty");
  }

  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      return Fail(outError, ErrorCode::IoFailure,
                  "unable to create directory " + path.parent_path().string() + ": " + ec.message());
    }
  }

  fs::path tmpPath = path;
  tmpPath += ".tmp";
  fs::remove(tmpPath, ec);

  {
    std::ofstream f(tmpPath, std::ios::binary | std::ios::trunc);
    if (!f) {
      return Fail(outError, ErrorCode::IoFailure, "unable to open for writing: " + tmpPath.string());
    }
    if (!data.empty()) {
      f.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }
    f.flush();
    if (!f) {
      f.close();
      fs::remove(tmpPath, ec);
      return Fail(outError, ErrorCode::IoFailure, "write failed: " + tmpPath.string());
    }
  }

  std::string syncErr;
  if (!SyncFile(tmpPath, syncErr)) {
    fs::remove(tmpPath, ec);
    return Fail(outError, ErrorCode::IoFailure, syncErr);
  }

  fs::rename(tmpPath, path, ec);
  if (ec) {
    const std::string msg = "unable to rename " + tmpPath.string() + " -> " + path.string() + ": " + ec.message();
    fs::remove(tmpPath, ec);
    return Fail(outError, ErrorCode::IoFailure, msg);
  }

  if (path.has_parent_path()) {
    // Advisory: the data itself is already durable.
    (void)SyncDirectory(path.parent_path(), syncErr);
  }
  return true;
}

} // namespace avfcomp

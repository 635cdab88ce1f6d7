#include <format>
#include <utility>

#include <brarchive/mmap.hpp>

#include "error.hpp"

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace brarchive {

namespace {

// Last OS error as text, for diagnostics
std::string lastSystemError() {
#ifdef _WIN32
  return std::format("error {}", GetLastError());
#else
  return std::format("{} (errno: {})", std::strerror(errno), errno);
#endif
}

void ioError(FormatError *outError, std::string_view what, const std::filesystem::path &path) {
  detail::setError(outError, FormatErrorKind::Io, 0,
                   std::format("{}: {}: {}", what, path.string(), lastSystemError()));
}

} // namespace

MappedFile::MappedFile() = default;

MappedFile::~MappedFile() {
  close();
}

MappedFile::MappedFile(MappedFile &&other) noexcept
    :
#ifdef _WIN32
      fileHandle_(std::exchange(other.fileHandle_, nullptr)),
      mappingHandle_(std::exchange(other.mappingHandle_, nullptr)),
#else
      fd_(std::exchange(other.fd_, -1)),
#endif
      data_(std::exchange(other.data_, nullptr)), size_(std::exchange(other.size_, 0)),
      writable_(std::exchange(other.writable_, false)) {
}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    cleanup();
#ifdef _WIN32
    fileHandle_ = std::exchange(other.fileHandle_, nullptr);
    mappingHandle_ = std::exchange(other.mappingHandle_, nullptr);
#else
    fd_ = std::exchange(other.fd_, -1);
#endif
    data_ = std::exchange(other.data_, nullptr);
    size_ = std::exchange(other.size_, 0);
    writable_ = std::exchange(other.writable_, false);
  }
  return *this;
}

bool MappedFile::openRead(const std::filesystem::path &path, FormatError *outError) {
  close();

#ifdef _WIN32
  fileHandle_ = CreateFileW(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING,
                            FILE_ATTRIBUTE_NORMAL, nullptr);
  if (fileHandle_ == INVALID_HANDLE_VALUE) {
    fileHandle_ = nullptr;
    ioError(outError, "Failed to open file for reading", path);
    return false;
  }

  LARGE_INTEGER fileSize;
  if (!GetFileSizeEx(static_cast<HANDLE>(fileHandle_), &fileSize)) {
    ioError(outError, "Failed to get file size", path);
    close();
    return false;
  }
  size_ = static_cast<size_t>(fileSize.QuadPart);
#else
  fd_ = ::open(path.string().c_str(), O_RDONLY);
  if (fd_ < 0) {
    ioError(outError, "Failed to open file for reading", path);
    return false;
  }

  struct stat st;
  if (fstat(fd_, &st) < 0) {
    ioError(outError, "Failed to get file size", path);
    close();
    return false;
  }
  size_ = static_cast<size_t>(st.st_size);
#endif

  // Zero-length mappings are not allowed on either platform
  if (size_ == 0) {
    detail::setError(outError, FormatErrorKind::Io, 0,
                     std::format("File is empty: {}", path.string()));
    close();
    return false;
  }

#ifdef _WIN32
  mappingHandle_ =
      CreateFileMappingW(static_cast<HANDLE>(fileHandle_), nullptr, PAGE_READONLY, 0, 0, nullptr);
  if (mappingHandle_) {
    data_ = MapViewOfFile(static_cast<HANDLE>(mappingHandle_), FILE_MAP_READ, 0, 0, 0);
  }
  if (!data_) {
    ioError(outError, "Failed to map file", path);
    close();
    return false;
  }
#else
  void *mapped = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
  if (mapped == MAP_FAILED) {
    ioError(outError, "Failed to map file", path);
    close();
    return false;
  }
  data_ = mapped;
#endif

  writable_ = false;
  return true;
}

bool MappedFile::openWrite(const std::filesystem::path &path, size_t size,
                           FormatError *outError) {
  close();

  if (size == 0) {
    detail::setError(outError, FormatErrorKind::Io, 0,
                     "Cannot create file mapping with zero size");
    return false;
  }

#ifdef _WIN32
  fileHandle_ = CreateFileW(path.c_str(), GENERIC_READ | GENERIC_WRITE, 0, nullptr, CREATE_ALWAYS,
                            FILE_ATTRIBUTE_NORMAL, nullptr);
  if (fileHandle_ == INVALID_HANDLE_VALUE) {
    fileHandle_ = nullptr;
    ioError(outError, "Failed to create file for writing", path);
    return false;
  }

  LARGE_INTEGER fileSize;
  fileSize.QuadPart = static_cast<LONGLONG>(size);
  if (!SetFilePointerEx(static_cast<HANDLE>(fileHandle_), fileSize, nullptr, FILE_BEGIN) ||
      !SetEndOfFile(static_cast<HANDLE>(fileHandle_))) {
    ioError(outError, "Failed to set file size", path);
    close();
    return false;
  }

  mappingHandle_ =
      CreateFileMappingW(static_cast<HANDLE>(fileHandle_), nullptr, PAGE_READWRITE, 0, 0, nullptr);
  if (mappingHandle_) {
    data_ = MapViewOfFile(static_cast<HANDLE>(mappingHandle_), FILE_MAP_WRITE, 0, 0, 0);
  }
  if (!data_) {
    ioError(outError, "Failed to map file", path);
    close();
    return false;
  }
#else
  fd_ = ::open(path.string().c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
  if (fd_ < 0) {
    ioError(outError, "Failed to create file for writing", path);
    return false;
  }

  if (ftruncate(fd_, static_cast<off_t>(size)) < 0) {
    ioError(outError, "Failed to set file size", path);
    close();
    return false;
  }

  void *mapped = mmap(nullptr, size, PROT_READ | PROT_WRITE, MAP_SHARED, fd_, 0);
  if (mapped == MAP_FAILED) {
    ioError(outError, "Failed to map file", path);
    close();
    return false;
  }
  data_ = mapped;
#endif

  size_ = size;
  writable_ = true;
  return true;
}

bool MappedFile::flush(FormatError *outError) {
  if (!data_ || !writable_) {
    detail::setError(outError, FormatErrorKind::Io, 0,
                     "Cannot flush: file not open or not writable");
    return false;
  }

#ifdef _WIN32
  if (!FlushViewOfFile(data_, 0) || !FlushFileBuffers(static_cast<HANDLE>(fileHandle_))) {
    detail::setError(outError, FormatErrorKind::Io, 0,
                     std::format("Failed to flush mapped file: {}", lastSystemError()));
    return false;
  }
#else
  if (msync(data_, size_, MS_SYNC) < 0) {
    detail::setError(outError, FormatErrorKind::Io, 0,
                     std::format("Failed to sync mapped file: {}", lastSystemError()));
    return false;
  }
#endif

  return true;
}

void MappedFile::close() {
  cleanup();
}

void MappedFile::cleanup() noexcept {
  if (data_) {
#ifdef _WIN32
    UnmapViewOfFile(data_);
#else
    munmap(data_, size_);
#endif
    data_ = nullptr;
  }

#ifdef _WIN32
  if (mappingHandle_) {
    CloseHandle(static_cast<HANDLE>(mappingHandle_));
    mappingHandle_ = nullptr;
  }
  if (fileHandle_) {
    CloseHandle(static_cast<HANDLE>(fileHandle_));
    fileHandle_ = nullptr;
  }
#else
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
#endif

  size_ = 0;
  writable_ = false;
}

} // namespace brarchive

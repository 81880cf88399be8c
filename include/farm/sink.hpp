/**
 * @file sink.hpp
 * @brief Destination of every delivered value, written by the dispatcher only.
 */

#ifndef FARM_SINK_HPP_
#define FARM_SINK_HPP_

#include "farm/log.hpp"
#include "farm/vocabulary.hpp"

#include <cerrno>
#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <cstring>

#include <string>
#include <vector>

namespace farm {

class Sink {
 public:
  virtual ~Sink() = default;

  /// @brief Append @p count values in order. Any failure is fatal to the run.
  virtual expected<void, FarmError> Append(const double* values, uint32_t count) = 0;
};

// ============================================================================
// FileSink
// ============================================================================

/**
 * @brief Text file, one value per line, printed with %.17g so that every
 * double reads back exactly.
 */
class FileSink final : public Sink {
 public:
  FileSink() noexcept = default;

  ~FileSink() override { (void)Close(); }

  FileSink(const FileSink&) = delete;
  FileSink& operator=(const FileSink&) = delete;

  /// @brief Default output name for a run of @p target values.
  static std::string DefaultPath(uint64_t target) {
    char name[64];
    (void)std::snprintf(name, sizeof(name), "random_%" PRIu64 "_nums.txt", target);
    return std::string(name);
  }

  /// @brief Create (truncate) @p path for writing.
  expected<void, FarmError> Open(const char* path) {
    if (file_ != nullptr) return expected<void, FarmError>::error(FarmError::kInvalidArgument);
    file_ = std::fopen(path, "w");
    if (file_ == nullptr) {
      FARM_LOG_ERROR("SINK", "cannot open %s: %s", path, std::strerror(errno));
      return expected<void, FarmError>::error(FarmError::kSinkFailure);
    }
    path_ = path;
    written_ = 0;
    return expected<void, FarmError>::success();
  }

  expected<void, FarmError> Append(const double* values, uint32_t count) override {
    if (file_ == nullptr) return expected<void, FarmError>::error(FarmError::kSinkFailure);
    for (uint32_t i = 0; i < count; ++i) {
      if (std::fprintf(file_, "%.17g\n", values[i]) < 0) {
        FARM_LOG_ERROR("SINK", "write to %s failed: %s", path_.c_str(), std::strerror(errno));
        return expected<void, FarmError>::error(FarmError::kSinkFailure);
      }
    }
    written_ += count;
    return expected<void, FarmError>::success();
  }

  /// @brief Flush and close. Safe to call twice.
  expected<void, FarmError> Close() noexcept {
    if (file_ == nullptr) return expected<void, FarmError>::success();
    const int rc = std::fclose(file_);
    file_ = nullptr;
    if (rc != 0) return expected<void, FarmError>::error(FarmError::kSinkFailure);
    return expected<void, FarmError>::success();
  }

  bool IsOpen() const noexcept { return file_ != nullptr; }
  uint64_t Written() const noexcept { return written_; }
  const std::string& Path() const noexcept { return path_; }

 private:
  FILE* file_ = nullptr;
  std::string path_;
  uint64_t written_ = 0;
};

// ============================================================================
// VectorSink
// ============================================================================

/// @brief In-memory sink; keeps each append as its own batch.
class VectorSink final : public Sink {
 public:
  expected<void, FarmError> Append(const double* values, uint32_t count) override {
    if (fail_after_ >= 0 && static_cast<int64_t>(batches_.size()) >= fail_after_) {
      return expected<void, FarmError>::error(FarmError::kSinkFailure);
    }
    batches_.emplace_back(values, values + count);
    total_ += count;
    return expected<void, FarmError>::success();
  }

  /// @brief Reject every append after the first @p batches (negative: never).
  void FailAfter(int64_t batches) noexcept { fail_after_ = batches; }

  const std::vector<std::vector<double>>& Batches() const noexcept { return batches_; }
  uint64_t Total() const noexcept { return total_; }

 private:
  std::vector<std::vector<double>> batches_;
  uint64_t total_ = 0;
  int64_t fail_after_ = -1;
};

}  // namespace farm

#endif  // FARM_SINK_HPP_

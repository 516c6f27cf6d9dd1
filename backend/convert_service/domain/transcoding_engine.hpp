#pragma once
#include "conversion_options.hpp"
#include "convert_error.hpp"
#include "media.hpp"

#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace convert_service {

struct TranscodeRequest {
  std::filesystem::path input_path;
  std::filesystem::path output_path;   // where the engine writes; a staging name
  MediaCategory source_category{MediaCategory::Audio};
  ConversionOptions options;
};

// One running engine invocation. Safe to call terminate() from another thread
// while a consumer is blocked in nextLine() or wait().
class TranscodeProcess {
public:
  virtual ~TranscodeProcess() = default;

  // Blocks until the next diagnostic line; nullopt once the stream is closed.
  virtual std::optional<std::string> nextLine() = 0;

  // Blocks until the process has exited. Terminated if terminate() stopped it,
  // Encode on a non-zero exit.
  virtual std::expected<void, ConvertError> wait() = 0;

  // Graceful stop, forced after the grace period. Returns once the process is gone.
  virtual void terminate() = 0;
};

class TranscodingEngine {
public:
  virtual ~TranscodingEngine() = default;
  virtual std::expected<std::shared_ptr<TranscodeProcess>, ConvertError> start(
    const TranscodeRequest& request) = 0;
};

} // namespace convert_service

#include "memo_core/errors.hpp"
#include "memo_core/types/memo.hpp"

namespace memo_core {

std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Configuration:
      return "Configuration";
    case ErrorKind::Hashing:
      return "Hashing";
    case ErrorKind::ServiceCall:
      return "ServiceCall";
    case ErrorKind::Persistence:
      return "Persistence";
    default:
      return "Unexpected";
  }
}

std::string to_string(MemoStage stage) {
  switch (stage) {
    case MemoStage::Selected:
      return "Selected";
    case MemoStage::Transcribing:
      return "Transcribing";
    case MemoStage::Summarizing:
      return "Summarizing";
    case MemoStage::Persisting:
      return "Persisting";
    case MemoStage::Linked:
      return "Linked";
    case MemoStage::Skipped:
      return "Skipped";
    default:
      return "Failed";
  }
}

}  // namespace memo_core

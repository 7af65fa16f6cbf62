#pragma once

#include <string>

#include "memo_core/types/memo.hpp"

namespace memo_core {

class SummaryClient {
 public:
  virtual ~SummaryClient() = default;

  /**
   * @brief Produces a title, a short filename-safe summary and a longer prose summary.
   * @throws ServiceError on transport failure, or when any of the three fields is missing.
   */
  virtual SummaryResult summarize(const std::string& transcript) = 0;
};

}  // namespace memo_core

#pragma once

#include <string>
#include <vector>

#include "../optimizer/stock.h"
#include "../types.h"
#include "job_load_result.h"

namespace rc {

// JSON batch definition:
//
// {
//   "format_version": 1,
//   "jobs": [
//     {
//       "id": "job-1",
//       "material": { "id": "steel-rod", "kerf": 2 },
//       "stock": [ { "id": "bar-6m", "length": 6000, "quantity": 10, "cost": 0 } ],
//       "cuts":  [ { "length": 1200, "quantity": 4, "label": "frame" } ]
//     }
//   ]
// }
//
// A stock "quantity" that is absent or -1 means unlimited. "cost" is optional.
class JobFile {
  public:
    static constexpr int kFormatVersion = 1;

    JobLoadResult load(const Path& path) const;
    JobLoadResult parse(const std::string& text) const;

    [[nodiscard]] bool save(const Path& path, const std::vector<optimizer::Job>& jobs) const;
    std::string serialize(const std::vector<optimizer::Job>& jobs) const;
};

} // namespace rc

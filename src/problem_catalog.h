#pragma once

#include "collaborators.h"

#include <string>

namespace gradebox {

// Problems stored on disk, one directory each:
//
//   <root>/<problem_id>/problem.json   {"language": "python",
//                                       "timeout_seconds": 10,
//                                       "memory_limit_mb": 256}
//   <root>/<problem_id>/tests/...      hidden tests, staged under tests/
//   <root>/<problem_id>/scaffold/...   build files, staged at the workspace root
//
// Read on every lookup, so edits take effect without a restart.
class DirectoryProblemCatalog : public ProblemLookup {
public:
    explicit DirectoryProblemCatalog(const std::string& root_dir);

    // Throws ConfigError when problem.json exists but is invalid
    std::optional<Problem> find_by_id(const std::string& problem_id) override;

private:
    std::string root_dir_;
};

} // namespace gradebox

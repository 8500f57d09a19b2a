#include "training/lightgbm_handles.hpp"
#include "core/errors.hpp"

#include <string>

namespace training {

void check_lgbm(int rc, const char *operation) {
  if (rc != 0)
    throw PipelineError(std::string("LightGBM ") + operation +
                        " failed: " + LGBM_GetLastError());
}

} // namespace training

#ifndef LIGHTGBM_HANDLES_HPP
#define LIGHTGBM_HANDLES_HPP

#include <LightGBM/c_api.h>

#include <memory>
#include <type_traits>

namespace training {

struct DatasetHandleDeleter {
  void operator()(void *handle) const {
    if (handle != nullptr)
      LGBM_DatasetFree(handle);
  }
};

struct BoosterHandleDeleter {
  void operator()(void *handle) const {
    if (handle != nullptr)
      LGBM_BoosterFree(handle);
  }
};

using DatasetPtr =
    std::unique_ptr<std::remove_pointer_t<DatasetHandle>, DatasetHandleDeleter>;
using BoosterPtr =
    std::unique_ptr<std::remove_pointer_t<BoosterHandle>, BoosterHandleDeleter>;

// Throws PipelineError carrying LGBM_GetLastError() when `rc` is non-zero
void check_lgbm(int rc, const char *operation);

} // namespace training

#endif // LIGHTGBM_HANDLES_HPP

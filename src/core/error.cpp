#include "sdrelog/core/error.hpp"

#include <string>

namespace sdrelog::core {
namespace {

// core::errc 的 std::error_category 实现：
// - name() 用于区分错误域
// - message() 返回可读的英文描述（配置出错时由调用方打印）
class sdrelog_error_category final : public std::error_category {
 public:
  const char *name() const noexcept override { return "sdrelog.core"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::invalid_level:
        return "invalid log level";
      case errc::invalid_color_mode:
        return "invalid color mode";
      case errc::invalid_time_zone:
        return "invalid time zone";
      case errc::invalid_stream_policy:
        return "invalid stream policy";
      case errc::invalid_location_style:
        return "invalid location style";
      default:
        return "unknown sdrelog.core error";
    }
  }
};

} // 匿名命名空间

const std::error_category &error_category() noexcept {
  static sdrelog_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

} // 命名空间 sdrelog::core

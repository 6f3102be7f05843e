#pragma once

#include <exception>
#include <optional>
#include <string_view>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/status.hpp"

namespace lifebank::util {

/*
  Runs a throwing entry point and reports its failure as a Status.

  NotInitialized is a setup defect and is rethrown, not converted.
*/
template <typename Fn>
Status TryCall(std::string_view route, Fn&& fn) {
  try {
    std::forward<Fn>(fn)();
    return Status::Ok();
  } catch (const NotInitialized&) {
    throw;
  } catch (const std::exception& e) {
    auto status = ToStatus(e);
    LIFEBANK_LOG_WARN("call rejected", {lifebank::observability::StringField("route", route),
                                        lifebank::observability::StringField("code", ErrorCodeName(status.code)),
                                        lifebank::observability::StringField("error", e.what())});
    return status;
  }
}

template <typename T, typename Fn>
Outcome<T> TryCallValue(std::string_view route, Fn&& fn) {
  std::optional<T> value;
  auto             status = TryCall(route, [&] { value.emplace(std::forward<Fn>(fn)()); });
  if (!status) {
    return Outcome<T>::Err(std::move(status));
  }
  return Outcome<T>::Ok(std::move(*value));
}

} // namespace lifebank::util

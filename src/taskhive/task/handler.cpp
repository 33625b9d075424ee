#include "taskhive/task/handler.hpp"

#include "taskhive/util/log.hpp"

#include <algorithm>

namespace taskhive {

auto HandlerRegistry::add(std::string_view name,
                          std::unique_ptr<TaskHandler> handler)
    -> Result<void> {
  if (frozen_) {
    log::warn("Handler registry is frozen, ignoring '{}'", name);
    return fail(Error::ReadOnly);
  }
  if (name.empty() || !handler) {
    return fail(Error::InvalidArgument);
  }
  auto [it, inserted] = handlers_.try_emplace(std::string(name));
  if (!inserted) {
    log::warn("Handler '{}' already registered", name);
    return fail(Error::AlreadyExists);
  }
  it->second = std::move(handler);
  log::debug("Registered handler '{}'", name);
  return ok();
}

auto HandlerRegistry::add(std::string_view name, HandlerFn fn)
    -> Result<void> {
  if (!fn) {
    return fail(Error::InvalidArgument);
  }
  return add(name, std::make_unique<FunctionHandler>(std::move(fn)));
}

auto HandlerRegistry::find(std::string_view name) const
    -> Result<TaskHandler*> {
  auto it = handlers_.find(name);
  if (it == handlers_.end()) {
    return fail(Error::UnknownHandler);
  }
  return it->second.get();
}

auto HandlerRegistry::contains(std::string_view name) const -> bool {
  return handlers_.find(name) != handlers_.end();
}

auto HandlerRegistry::names() const -> std::vector<std::string> {
  std::vector<std::string> out;
  out.reserve(handlers_.size());
  for (const auto& [name, _] : handlers_) {
    out.push_back(name);
  }
  std::ranges::sort(out);
  return out;
}

}  // namespace taskhive

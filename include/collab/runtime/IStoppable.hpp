#pragma once
namespace collab::rt {
struct IStoppable {
  virtual ~IStoppable() = default;
  virtual void stop() noexcept = 0; // idempotent
};
} // namespace collab::rt

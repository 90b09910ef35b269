#pragma once
/**
 * @file host_handle.hpp
 * @brief Opaque, typed references to objects living inside the automation host.
 *
 * A binding hands out `AppHandle`, `DocumentHandle` and `SheetHandle` values. They carry no
 * behaviour: all access goes back through `HostBinding` (and therefore through `HostSession`).
 * The tag parameter keeps the three kinds from being mixed up at compile time.
 *
 * The payload is a `std::shared_ptr<void>` so each binding can store its native reference
 * (a COM `IDispatch*`, an index into a fake table, ...) together with a deleter that releases
 * it. Copies share the reference; the native object is released with the last copy.
 */

#include <memory>
#include <utility>

namespace hostkeeper::host
{

template <typename Tag> class OpaqueHandle
{
  public:
    OpaqueHandle() = default;
    explicit OpaqueHandle(std::shared_ptr<void> native) : m_native(std::move(native)) {}

    [[nodiscard]] explicit operator bool() const noexcept { return static_cast<bool>(m_native); }

    /// @brief Binding-side access to the stored reference.
    [[nodiscard]] const std::shared_ptr<void> &native() const noexcept { return m_native; }

    /// @brief Convenience cast for bindings that know the stored type.
    template <typename T> [[nodiscard]] T *get() const noexcept
    {
        return static_cast<T *>(m_native.get());
    }

    void reset() noexcept { m_native.reset(); }

    friend bool operator==(const OpaqueHandle &a, const OpaqueHandle &b) noexcept
    {
        return a.m_native == b.m_native;
    }

  private:
    std::shared_ptr<void> m_native;
};

struct AppTag;
struct DocumentTag;
struct SheetTag;

using AppHandle = OpaqueHandle<AppTag>;
using DocumentHandle = OpaqueHandle<DocumentTag>;
using SheetHandle = OpaqueHandle<SheetTag>;

} // namespace hostkeeper::host

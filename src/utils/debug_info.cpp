/**
 * @file debug_info.cpp
 * @brief Cross-platform stack trace printing for hostkeeper::debug::print_stack_trace().
 *
 * Windows resolves frames through DbgHelp; POSIX uses backtrace() with dladdr() and the
 * Itanium demangler. Frames are printed one per line as "#n symbol+offset (module)".
 */

#include "hk_base.hpp"

#if defined(HOSTKEEPER_PLATFORM_WIN64)

#include <dbghelp.h>
#pragma comment(lib, "dbghelp.lib")

#elif defined(HOSTKEEPER_IS_POSIX)

#include <cxxabi.h>
#include <dlfcn.h>
#include <execinfo.h>

#endif

#include <array>
#include <cstring>
#include <memory>

namespace hostkeeper::debug
{

namespace
{
constexpr int kMaxFrames = 64;
// skip print_stack_trace's own frame
constexpr int kSkipFrames = 1;

#if defined(HOSTKEEPER_PLATFORM_WIN64)
class DbgHelpInitializer
{
  public:
    DbgHelpInitializer()
    {
        SymSetOptions(SYMOPT_LOAD_LINES | SYMOPT_DEFERRED_LOADS | SYMOPT_UNDNAME);
        m_ok = SymInitialize(GetCurrentProcess(), nullptr, TRUE) == TRUE;
    }
    ~DbgHelpInitializer()
    {
        if (m_ok)
            SymCleanup(GetCurrentProcess());
    }
    bool ok() const { return m_ok; }

  private:
    bool m_ok = false;
};
#endif

#if defined(HOSTKEEPER_IS_POSIX)
std::string demangle(const char *mangled)
{
    if (mangled == nullptr)
        return "??";
    int status = 0;
    std::unique_ptr<char, void (*)(void *)> out(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
    return (status == 0 && out) ? std::string(out.get()) : std::string(mangled);
}
#endif
} // namespace

void print_stack_trace() noexcept
{
    try
    {
        fmt::print(stderr, "[STACK] --- stack trace (most recent call first) ---\n");
#if defined(HOSTKEEPER_PLATFORM_WIN64)
        static DbgHelpInitializer dbghelp;
        std::array<void *, kMaxFrames> frames{};
        const USHORT count = CaptureStackBackTrace(kSkipFrames, kMaxFrames, frames.data(), nullptr);

        alignas(SYMBOL_INFO) char storage[sizeof(SYMBOL_INFO) + MAX_SYM_NAME];
        auto *symbol = reinterpret_cast<SYMBOL_INFO *>(storage);
        for (USHORT i = 0; i < count; ++i)
        {
            const auto addr = reinterpret_cast<DWORD64>(frames[i]);
            std::memset(storage, 0, sizeof(storage));
            symbol->SizeOfStruct = sizeof(SYMBOL_INFO);
            symbol->MaxNameLen = MAX_SYM_NAME;
            DWORD64 displacement = 0;
            if (dbghelp.ok() && SymFromAddr(GetCurrentProcess(), addr, &displacement, symbol))
            {
                IMAGEHLP_LINE64 line{};
                line.SizeOfStruct = sizeof(line);
                DWORD line_disp = 0;
                if (SymGetLineFromAddr64(GetCurrentProcess(), addr, &line_disp, &line))
                    fmt::print(stderr, "[STACK] #{:<2} {}+0x{:x} ({}:{})\n", i, symbol->Name,
                               displacement, format_tools::filename_only(line.FileName),
                               line.LineNumber);
                else
                    fmt::print(stderr, "[STACK] #{:<2} {}+0x{:x}\n", i, symbol->Name, displacement);
            }
            else
            {
                fmt::print(stderr, "[STACK] #{:<2} 0x{:x}\n", i, addr);
            }
        }
#elif defined(HOSTKEEPER_IS_POSIX)
        std::array<void *, kMaxFrames> frames{};
        const int count = backtrace(frames.data(), kMaxFrames);
        for (int i = kSkipFrames; i < count; ++i)
        {
            Dl_info info{};
            const auto addr = reinterpret_cast<uintptr_t>(frames[i]);
            if (dladdr(frames[i], &info) != 0 && info.dli_sname != nullptr)
            {
                const auto offset = addr - reinterpret_cast<uintptr_t>(info.dli_saddr);
                fmt::print(stderr, "[STACK] #{:<2} {}+0x{:x} ({})\n", i - kSkipFrames,
                           demangle(info.dli_sname), offset,
                           format_tools::filename_only(info.dli_fname ? info.dli_fname : "??"));
            }
            else
            {
                fmt::print(stderr, "[STACK] #{:<2} 0x{:x} ({})\n", i - kSkipFrames, addr,
                           format_tools::filename_only(
                               (info.dli_fname != nullptr) ? info.dli_fname : "??"));
            }
        }
#else
        fmt::print(stderr, "[STACK] stack traces are not supported on this platform\n");
#endif
        fmt::print(stderr, "[STACK] --- end of stack trace ---\n");
        std::fflush(stderr);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[STACK] failed to print stack trace: %s\n", e.what());
    }
}

} // namespace hostkeeper::debug

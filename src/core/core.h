#pragma once

#include <stdio.h>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>
#include <assert.h>
#include <chrono>

#if defined(WPS_IS_WINDOWS)
# pragma warning( disable : 4514 5045 )
# if defined(WPS_DEBUG)
extern "C" { __declspec(dllimport) void __stdcall OutputDebugStringA(const char*); }
#   define WPS_PUTI(S) do { const char* s = S; fputs(s, stdout); OutputDebugStringA(s); } while(0)
#   define WPS_PUTE(S) do { const char* s = S; fputs(s, stderr); OutputDebugStringA(s); } while(0)
# endif
#else
inline bool fopen_s(FILE** pfp, const char* path, const char* mode) {
  *pfp = fopen(path, mode);
  return !*pfp;
}
#define sprintf_s(DST, MAX_COUNT, FMT, ...) snprintf(DST, MAX_COUNT, FMT, ##__VA_ARGS__)
#endif

#if !defined(WPS_PUTI)
# define WPS_PUTI(S) do { const char* s = S; fputs(s, stdout); } while(0)
# define WPS_PUTE(S) do { const char* s = S; fputs(s, stderr); } while(0)
#endif

// move-only. members must be movable.
#define WPS_DECL_NO_COPY(CLASS) \
  CLASS(const CLASS&) = delete; \
  CLASS& operator =(const CLASS&) = delete; \
  CLASS(CLASS&&) noexcept = default; \
  CLASS& operator =(CLASS&&) noexcept = default;

#define WPS_LOGI(FMT, ...) \
  do { \
    char log_line[1024]; \
    sprintf_s(log_line, sizeof(log_line), "(%d): " FMT "\n", __LINE__, ##__VA_ARGS__); \
    WPS_PUTI(wps::core::log::basename(__FILE__)); \
    WPS_PUTI(log_line); fflush(stdout); \
  } while(0)

#define WPS_LOGE(FMT, ...) \
  do { \
    char log_line[1024]; \
    sprintf_s(log_line, sizeof(log_line), "(%d): " FMT "\n", __LINE__, ##__VA_ARGS__); \
    WPS_PUTE(wps::core::log::basename(__FILE__)); \
    WPS_PUTE(log_line); fflush(stderr); \
  } while(0)

#define WPS_PRINT(FMT, ...) \
  do { \
    char log_line[1024]; \
    sprintf_s(log_line, sizeof(log_line), FMT, ##__VA_ARGS__); \
    WPS_PUTI(log_line); fflush(stdout); \
  } while(0)

#if defined(WPS_DEBUG)
# define WPS_VERIFY(COND, FMT, ...) \
  do { \
    auto check_fail = !(COND); \
    if (check_fail) { \
      WPS_LOGE(#COND " is false. " FMT, ##__VA_ARGS__); \
      assert(false); \
    } \
  } while(0)
#else
# define WPS_VERIFY(...) do { } while(0)
#endif

namespace wps::core {
  namespace log {
    inline const char* basename(const char* file) {
      for (const char* p = file; *p; p++) {
        if (*p == '\\' || *p == '/') {
          file = p + 1;
        }
      }
      return file;
    }
  }
  using clock = std::chrono::steady_clock;

  class ScopedTimer {
  public:
    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator =(const ScopedTimer&) = delete;

    enum class Units : uint32_t { ns, us, ms, s };

    ScopedTimer()
      : start(clock::now())
    {}

    // logs msg with the elapsed time when it goes out of scope.
    explicit ScopedTimer(const char* file, uint32_t line, const char* msg, Units units = Units::ms)
      : start(clock::now()), msg(msg), file(log::basename(file)), units(units), line(line)
    {
    }

    ~ScopedTimer() {
      if (msg) {
        char time_buf[64];
        char num_buf[32];
        sprintf_s(time_buf, sizeof(time_buf), " [%0.3lf%s]\n", elapsed(units), units_sfx(units));
        sprintf_s(num_buf, sizeof(num_buf), "(%u): ", line);
        WPS_PUTI(file);
        WPS_PUTI(num_buf);
        WPS_PUTI(msg);
        WPS_PUTI(time_buf);
      }
    }

    double elapsed(Units u) const {
      switch (u) {
      case Units::ns: return elapsed_ns();
      case Units::us: return elapsed_us();
      case Units::ms: return elapsed_ms();
      case Units::s: return elapsed_s();
      }
      return 0.0;
    }

    static const char* units_sfx(Units u) {
      static const char* sym[] = { "ns", "us", "ms", "s" };
      return (u <= Units::s) ? sym[uint32_t(u)] : "ER";
    }

    double elapsed_ns() const {
      return double(elapsed_dur().count());
    }

    double elapsed_us() const {
      return elapsed_ns() / 1000.0;
    }

    double elapsed_ms() const {
      return elapsed_ns() / 1000000.0;
    }

    double elapsed_s() const {
      return elapsed_ns() / 1000000000.0;
    }

  private:
    std::chrono::nanoseconds elapsed_dur() const {
      return std::chrono::duration_cast<std::chrono::nanoseconds>(clock::now() - start);
    }

  private:
    const clock::time_point start;
    const char* msg = nullptr;
    const char* file = nullptr;
    Units units = Units::ms;
    uint32_t line = 0;
  };

  struct File {
    FILE* fp = nullptr;

    File(const File&) = delete;
    File& operator =(const File&) = delete;

    File(File&& rhs) noexcept : fp(rhs.fp) {
      rhs.fp = nullptr;
    }

    File& operator =(File&& rhs) noexcept {
      if (this != &rhs) {
        close();
        fp = rhs.fp;
        rhs.fp = nullptr;
      }
      return *this;
    }

    explicit File(const char* path, const char* mode) {
      if (fopen_s(&fp, path, mode)) {
        fp = nullptr;
      }
    }

    operator FILE* () { return fp; }
    operator bool() const { return !!fp; }
    bool operator!() const { return !fp; }

    uint32_t size_bytes() {
      fseek(fp, 0, SEEK_END);
      const auto sz = ftell(fp);
      rewind(fp);
      return sz > 0 ? uint32_t(sz) : 0;
    }

    void close() {
      if (fp) {
        fclose(fp);
        fp = nullptr;
      }
    }

    ~File() {
      close();
    }
  };
} // namespace wps::core

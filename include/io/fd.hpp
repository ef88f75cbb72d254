#pragma once

#include "util/result.hpp"

#include <string>

namespace coldstash {

// Owning POSIX file descriptor.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    static Result OpenRead(const std::string& path, Fd& out);
    // Creates or truncates; mode applies to newly created files.
    static Result OpenWrite(const std::string& path, Fd& out, int mode = 0644);

    int Get() const;
    bool Valid() const;

    void Reset(int fd);
    int Release();
    void Close();

  private:
    int fd_{-1};
};

} // namespace coldstash

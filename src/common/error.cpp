#include "common/error.hpp"

#include <cerrno>

namespace pagekv {

namespace {

class PagekvCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "pagekv"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::corruption:      return "data corruption detected";
            case Errc::short_read:      return "unexpected end of file";
            case Errc::entry_too_large: return "entry does not fit in a page";
            case Errc::not_open:        return "store is not open";
            case Errc::wal_failed:      return "WAL failed a previous sync and must be reopened";
        }
        return "unknown pagekv error";
    }
};

} // anonymous namespace

const std::error_category& pagekv_category() noexcept {
    static const PagekvCategory category;
    return category;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), pagekv_category()};
}

std::error_code last_system_error() noexcept {
    return {errno, std::system_category()};
}

bool is_corruption(const std::error_code& ec) noexcept {
    return ec == Errc::corruption;
}

bool is_io_error(const std::error_code& ec) noexcept {
    if (ec.category() == std::system_category()) return static_cast<bool>(ec);
    return ec == Errc::short_read || ec == Errc::wal_failed;
}

} // namespace pagekv

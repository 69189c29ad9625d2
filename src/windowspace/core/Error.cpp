#include <windowspace/core/Error.hpp>

namespace WS {

auto describeException(std::exception_ptr const& fault) -> std::string {
    if (!fault) {
        return "no exception";
    }
    try {
        std::rethrow_exception(fault);
    } catch (std::exception const& e) {
        return e.what();
    } catch (std::string const& s) {
        return s;
    } catch (char const* s) {
        return s ? std::string{s} : std::string{"null message"};
    } catch (...) {
        return "non-standard exception";
    }
}

} // namespace WS

#include "icmpecho/handle.hpp"
#include "native_driver.hpp"

#include <stdexcept>

namespace icmpecho {

EchoHandle EchoHandle::open(AddressFamily family) {
    return EchoHandle(std::shared_ptr<EchoDriver>(detail::open_native_driver(family)));
}

EchoHandle EchoHandle::adopt(std::unique_ptr<EchoDriver> driver) {
    if (!driver)
        throw std::invalid_argument("EchoHandle::adopt: null driver");
    return EchoHandle(std::shared_ptr<EchoDriver>(std::move(driver)));
}

} // namespace icmpecho

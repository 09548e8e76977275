#pragma once

#include <cstddef>
#include <string>

namespace Device
{
/**
 * @brief Outbound byte sink the emitter writes sentences to
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * @brief Write the whole buffer
     *
     * @return int Number of bytes written, or -1 on error
     */
    virtual int writeData(const char* pBuf, size_t length) = 0;

    virtual const std::string& getName() const = 0;
};
} // namespace Device::

#include "remotefs/crypto.hpp"

#include <array>
#include <mutex>
#include <span>
#include <stdexcept>

#include <sodium.h>

namespace remotefs::crypto
{

    namespace
    {

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        void append_hex(std::string &out, std::span<const unsigned char> data)
        {
            static constexpr char kHexDigits[] = "0123456789abcdef";
            for (const auto byte : data)
            {
                out.push_back(kHexDigits[(byte >> 4) & 0x0F]);
                out.push_back(kHexDigits[byte & 0x0F]);
            }
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

    } // namespace

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    std::string generate_task_id()
    {
        ensure_initialized_once();
        std::array<unsigned char, 16> bytes{};
        randombytes_buf(bytes.data(), bytes.size());
        bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
        bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

        const std::span<const unsigned char> view(bytes);
        std::string id;
        id.reserve(36);
        append_hex(id, view.subspan(0, 4));
        id.push_back('-');
        append_hex(id, view.subspan(4, 2));
        id.push_back('-');
        append_hex(id, view.subspan(6, 2));
        id.push_back('-');
        append_hex(id, view.subspan(8, 2));
        id.push_back('-');
        append_hex(id, view.subspan(10, 6));
        return id;
    }

} // namespace remotefs::crypto

#include "postsink/ingest/request.hpp"

#include <cstring>

namespace postsink::ingest {

    void response_set(Response* out, u16 status, const char* body) noexcept {
        if (out == nullptr) {
            return;
        }
        out->status = status;
        const size_t n = body != nullptr ? std::strlen(body) : 0;
        const size_t len = n < sizeof(out->body) ? n : sizeof(out->body) - 1;
        if (len > 0) {
            std::memcpy(out->body, body, len);
        }
        out->body[len] = '\0';
        out->body_len = static_cast<u32>(len);
    }

} // namespace postsink::ingest

#include "transfer_decoding.hpp"
#include "mime_decode.hpp"
#include "utils.hpp"

#include <gmime/gmime.h>

namespace inboxkit::mime {

std::string decode_quoted_printable(std::string_view data) {
    if (data.empty()) {
        return {};
    }

    std::string decoded(data.size(), '\0');
    int state = 0;
    guint32 save = 0;
    const size_t decoded_size = g_mime_encoding_quoted_decode_step(
        reinterpret_cast<const unsigned char*>(data.data()), data.size(),
        reinterpret_cast<unsigned char*>(decoded.data()), &state, &save);
    decoded.resize(decoded_size);
    return decoded;
}

std::string decode_transfer_encoding(std::string_view data, transfer_encoding_t encoding) {
    switch (encoding) {
        case transfer_encoding_t::base64:
            return utils::base64_lenient_decode(data);
        case transfer_encoding_t::quoted_printable:
            return decode_quoted_printable(data);
        case transfer_encoding_t::enc_8bit:
            if (data.find("=?") != std::string_view::npos) {
                return decode_mime_str(data);
            }
            return std::string{data};
        case transfer_encoding_t::binary:
        case transfer_encoding_t::enc_7bit:
        case transfer_encoding_t::other:
            return std::string{data};
    }
    return std::string{data};
}

}  // namespace inboxkit::mime

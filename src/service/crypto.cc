#include "crypto.h"

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace crypto {
    std::vector<unsigned char> randomBytes(const size_t count) {
        std::vector<unsigned char> buffer(count);
        if (RAND_bytes(buffer.data(), static_cast<int>(count)) != 1) {
            throw std::runtime_error("Error generating random bytes");
        }
        return buffer;
    }

    std::string generateSecureRandomString(const size_t length) {
        const size_t byteCount = (length + 1) / 2;
        const auto buffer = randomBytes(byteCount);

        std::ostringstream oss;
        for (const unsigned char byte: buffer) {
            oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
        }

        return oss.str().substr(0, length);
    }

    std::string base64Encode(const std::vector<unsigned char> &data) {
        BIO *bio = BIO_new(BIO_f_base64());
        BIO *bmem = BIO_new(BIO_s_mem());
        bio = BIO_push(bio, bmem);
        BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL); // No newline

        BIO_write(bio, data.data(), static_cast<int>(data.size()));
        BIO_flush(bio);

        BUF_MEM *bptr;
        BIO_get_mem_ptr(bio, &bptr);

        std::string encoded(bptr->data, bptr->length);
        BIO_free_all(bio);
        return encoded;
    }

    std::string generatePassword(const size_t length) {
        // 3 bytes encode to 4 characters
        auto encoded = base64Encode(randomBytes((length * 3 + 3) / 4 + 3));
        for (char &c: encoded) {
            if (c == '+')
                c = 'A';
            else if (c == '/')
                c = 'B';
        }
        std::erase(encoded, '=');
        return encoded.substr(0, length);
    }
}

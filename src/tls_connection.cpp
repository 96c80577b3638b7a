#include "tls_connection.hpp"
#include "errors.hpp"
#include <mbedtls/net_sockets.h>
#include <mbedtls/ssl.h>
#include <mbedtls/entropy.h>
#include <mbedtls/ctr_drbg.h>
#include <mbedtls/error.h>
#include <mbedtls/x509_crt.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <mutex>

// MSG_NOSIGNAL doesn't exist on Android/Termux
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace volley {

namespace {

std::string tls_error(const std::string& what, int ret) {
    char buf[128];
    mbedtls_strerror(ret, buf, sizeof(buf));
    return what + ": " + buf;
}

// System CA bundle, loaded once and shared read-only by every session
class CAStore {
public:
    static CAStore& instance() {
        static CAStore store;
        return store;
    }

    mbedtls_x509_crt* chain() {
        std::call_once(loaded_, [this] { load(); });
        return &cacert_;
    }

private:
    CAStore() { mbedtls_x509_crt_init(&cacert_); }
    ~CAStore() { mbedtls_x509_crt_free(&cacert_); }

    void load() {
        // Try multiple common paths for different systems
        const char* ca_files[] = {
            "/etc/ssl/certs/ca-certificates.crt",               // Debian/Ubuntu
            "/etc/pki/tls/certs/ca-bundle.crt",                 // RHEL/CentOS
            "/etc/ssl/cert.pem",                                // Alpine, OpenBSD
            "/data/data/com.termux/files/usr/etc/tls/cert.pem", // Termux
            nullptr
        };
        for (int i = 0; ca_files[i] != nullptr; i++) {
            if (mbedtls_x509_crt_parse_file(&cacert_, ca_files[i]) == 0) {
                return;
            }
        }

        const char* ca_paths[] = {
            "/etc/ssl/certs",
            "/etc/pki/tls/certs",
            "/usr/local/share/certs",            // FreeBSD
            "/system/etc/security/cacerts",      // Android
            nullptr
        };
        for (int i = 0; ca_paths[i] != nullptr; i++) {
            if (mbedtls_x509_crt_parse_path(&cacert_, ca_paths[i]) >= 0) {
                return;
            }
        }
    }

    mbedtls_x509_crt cacert_;
    std::once_flag loaded_;
};

// BIO callbacks over the raw socket
int ssl_send(void* ctx, const unsigned char* buf, size_t len) {
    int fd = *static_cast<int*>(ctx);
    ssize_t ret = ::send(fd, buf, len, MSG_NOSIGNAL);
    if (ret < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return MBEDTLS_ERR_SSL_WANT_WRITE;
        }
        return MBEDTLS_ERR_NET_SEND_FAILED;
    }
    return static_cast<int>(ret);
}

int ssl_recv(void* ctx, unsigned char* buf, size_t len) {
    int fd = *static_cast<int*>(ctx);
    ssize_t ret = ::recv(fd, buf, len, 0);
    if (ret < 0) {
        // SO_RCVTIMEO expired
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return MBEDTLS_ERR_SSL_WANT_READ;
        }
        return MBEDTLS_ERR_NET_RECV_FAILED;
    }
    if (ret == 0) {
        return MBEDTLS_ERR_SSL_PEER_CLOSE_NOTIFY;
    }
    return static_cast<int>(ret);
}

} // namespace

class TLSConnection::Impl {
public:
    mbedtls_ssl_context ssl;
    mbedtls_ssl_config conf;
    mbedtls_entropy_context entropy;
    mbedtls_ctr_drbg_context ctr_drbg;

    Impl() {
        mbedtls_ssl_init(&ssl);
        mbedtls_ssl_config_init(&conf);
        mbedtls_entropy_init(&entropy);
        mbedtls_ctr_drbg_init(&ctr_drbg);
    }

    ~Impl() {
        mbedtls_ssl_free(&ssl);
        mbedtls_ssl_config_free(&conf);
        mbedtls_entropy_free(&entropy);
        mbedtls_ctr_drbg_free(&ctr_drbg);
    }
};

TLSConnection::TLSConnection(int socket_fd, const std::string& hostname, bool verify)
    : impl_(std::make_unique<Impl>()),
      socket_fd_(socket_fd),
      hostname_(hostname),
      verify_(verify),
      connected_(false) {
}

TLSConnection::~TLSConnection() {
    close();
}

void TLSConnection::handshake() {
    const char* pers = "volley";

    int ret = mbedtls_ctr_drbg_seed(&impl_->ctr_drbg, mbedtls_entropy_func,
                                    &impl_->entropy,
                                    reinterpret_cast<const unsigned char*>(pers),
                                    strlen(pers));
    if (ret != 0) {
        throw SSLError(tls_error("Failed to seed RNG", ret));
    }

    ret = mbedtls_ssl_config_defaults(&impl_->conf,
                                      MBEDTLS_SSL_IS_CLIENT,
                                      MBEDTLS_SSL_TRANSPORT_STREAM,
                                      MBEDTLS_SSL_PRESET_DEFAULT);
    if (ret != 0) {
        throw SSLError(tls_error("Failed to configure TLS", ret));
    }

    // Set minimum TLS version to 1.2
    mbedtls_ssl_conf_min_version(&impl_->conf, MBEDTLS_SSL_MAJOR_VERSION_3,
                                 MBEDTLS_SSL_MINOR_VERSION_3);

    if (verify_) {
        mbedtls_ssl_conf_authmode(&impl_->conf, MBEDTLS_SSL_VERIFY_REQUIRED);
        mbedtls_ssl_conf_ca_chain(&impl_->conf, CAStore::instance().chain(), nullptr);
    } else {
        mbedtls_ssl_conf_authmode(&impl_->conf, MBEDTLS_SSL_VERIFY_NONE);
    }
    mbedtls_ssl_conf_rng(&impl_->conf, mbedtls_ctr_drbg_random, &impl_->ctr_drbg);

    ret = mbedtls_ssl_setup(&impl_->ssl, &impl_->conf);
    if (ret != 0) {
        throw SSLError(tls_error("Failed to set up TLS session", ret));
    }

    // SNI, and the name checked against the certificate
    ret = mbedtls_ssl_set_hostname(&impl_->ssl, hostname_.c_str());
    if (ret != 0) {
        throw SSLError(tls_error("Failed to set TLS hostname", ret));
    }

    mbedtls_ssl_set_bio(&impl_->ssl, &socket_fd_, ssl_send, ssl_recv, nullptr);

    while ((ret = mbedtls_ssl_handshake(&impl_->ssl)) != 0) {
        if (ret == MBEDTLS_ERR_SSL_WANT_READ) {
            throw ConnectTimeout("TLS handshake with " + hostname_ + " timed out");
        }
        if (ret != MBEDTLS_ERR_SSL_WANT_WRITE) {
            if (ret == MBEDTLS_ERR_X509_CERT_VERIFY_FAILED) {
                char info[512];
                mbedtls_x509_crt_verify_info(info, sizeof(info), "",
                                             mbedtls_ssl_get_verify_result(&impl_->ssl));
                throw SSLError("Certificate verification failed for " + hostname_ + ": " + info);
            }
            throw SSLError(tls_error("TLS handshake with " + hostname_ + " failed", ret));
        }
    }

    connected_ = true;
}

void TLSConnection::send(const void* data, size_t len) {
    if (!connected_) {
        throw ConnectionError("TLS session is not established");
    }

    const unsigned char* buf = static_cast<const unsigned char*>(data);
    size_t written = 0;

    while (written < len) {
        int ret = mbedtls_ssl_write(&impl_->ssl, buf + written, len - written);
        if (ret < 0) {
            // SO_SNDTIMEO expired
            if (ret == MBEDTLS_ERR_SSL_WANT_WRITE) {
                throw Timeout("TLS write to " + hostname_ + " timed out");
            }
            if (ret == MBEDTLS_ERR_SSL_WANT_READ) {
                continue;
            }
            throw ConnectionError(tls_error("TLS write failed", ret));
        }
        written += ret;
    }
}

size_t TLSConnection::recv(void* data, size_t len) {
    if (!connected_) {
        return 0;
    }

    unsigned char* buf = static_cast<unsigned char*>(data);
    while (true) {
        int ret = mbedtls_ssl_read(&impl_->ssl, buf, len);
        if (ret >= 0) {
            return static_cast<size_t>(ret);
        }
        if (ret == MBEDTLS_ERR_SSL_PEER_CLOSE_NOTIFY) {
            return 0;
        }
        if (ret == MBEDTLS_ERR_SSL_WANT_READ) {
            throw ReadTimeout("Read timed out from " + hostname_);
        }
        if (ret == MBEDTLS_ERR_SSL_WANT_WRITE) {
            continue;
        }
        throw ConnectionError(tls_error("TLS read failed", ret));
    }
}

void TLSConnection::close() {
    if (connected_) {
        mbedtls_ssl_close_notify(&impl_->ssl);
        connected_ = false;
    }
}

} // namespace volley

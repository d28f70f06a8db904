#pragma once
#include <string>
#include <string_view>

// Forward declare OpenSSL types to avoid pulling in headers everywhere
typedef struct ssl_ctx_st SSL_CTX;
typedef struct ssl_st SSL;

// Client-side TLS context for rediss:// connections.
// Uses OpenSSL BIO memory pairs for non-blocking integration with io_uring
class tls_context
{
public:
    tls_context();
    ~tls_context();

    tls_context(const tls_context&) = delete;
    tls_context& operator=(const tls_context&) = delete;

    // If ca_path is empty the system default trust store is used.
    // verify=false disables peer verification entirely (self-signed test servers).
    // If client_cert/client_key are non-empty, presents a client certificate (for mTLS)
    bool init_client(std::string_view ca_path = {},
                     std::string_view client_cert = {},
                     std::string_view client_key = {},
                     bool verify = true);

    // Create SSL in client mode with SNI and, when verifying, hostname checks.
    // server_name may be empty (unix sockets, IP literals without SNI).
    SSL* create_ssl_client(std::string_view server_name) const;

    // Returns: 1 = complete, 0 = want more data, -1 = error
    static int do_handshake(SSL* ssl);

    // Read decrypted data from SSL
    // Returns bytes read, 0 = want more data, -1 = error/closed
    static int ssl_read(SSL* ssl, char* buf, int len);

    // Write data to SSL (encrypts)
    // Returns bytes written, 0 = want more data, -1 = error
    static int ssl_write(SSL* ssl, const char* buf, int len);

    // Read encrypted data from SSL's output BIO (to send via io_uring)
    static int bio_read_out(SSL* ssl, char* buf, int len);

    // Write encrypted data into SSL's input BIO (received from io_uring)
    static int bio_write_in(SSL* ssl, const char* buf, int len);

    // Check if SSL needs to write (has pending encrypted output)
    static bool has_pending_out(SSL* ssl);

    static void free_ssl(SSL* ssl);

    // Drains the OpenSSL error queue into one line.
    static std::string last_error();

    bool is_initialized() const { return m_ctx != nullptr; }
    bool verifies_peer() const { return m_verify; }

private:
    SSL_CTX* m_ctx = nullptr;
    bool m_verify = true;
};

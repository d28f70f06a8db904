#include "tls_context.h"

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/bio.h>
#include <openssl/x509v3.h>

#include <arpa/inet.h>

#include "logging.h"

tls_context::tls_context() = default;

tls_context::~tls_context()
{
    if (m_ctx)
        SSL_CTX_free(m_ctx);
}

// Options every per-connection SSL object inherits.
static void apply_ctx_options(SSL_CTX* ctx)
{
    long opts = SSL_CTX_get_options(ctx);
    opts &= ~SSL_OP_NO_TICKET;
#if defined(SSL_OP_NO_RENEGOTIATION)
    opts |= SSL_OP_NO_RENEGOTIATION;
#endif
    SSL_CTX_set_options(ctx, opts);

    // SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER: a retried SSL_write may pass the
    // same bytes from a different address after the command buffer grew.
    long mode = SSL_MODE_RELEASE_BUFFERS | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER
              | SSL_MODE_AUTO_RETRY;
    SSL_CTX_set_mode(ctx, mode);
}

std::string tls_context::last_error()
{
    std::string out;
    unsigned long e;
    char buf[256];
    while ((e = ERR_get_error()) != 0)
    {
        ERR_error_string_n(e, buf, sizeof(buf));
        if (!out.empty())
            out += "; ";
        out += buf;
    }
    return out.empty() ? std::string("unknown TLS error") : out;
}

bool tls_context::init_client(std::string_view ca_path,
                              std::string_view client_cert,
                              std::string_view client_key,
                              bool verify)
{
    if (m_ctx)
    {
        SSL_CTX_free(m_ctx);
        m_ctx = nullptr;
    }

    m_ctx = SSL_CTX_new(TLS_client_method());
    if (!m_ctx)
    {
        LOG_ERROR(("tls: failed to create SSL context: " + last_error()).c_str());
        return false;
    }
    SSL_CTX_set_min_proto_version(m_ctx, TLS1_2_VERSION);

    // Client-side session cache
    SSL_CTX_set_session_cache_mode(m_ctx, SSL_SESS_CACHE_CLIENT);
    SSL_CTX_sess_set_cache_size(m_ctx, 64);

    apply_ctx_options(m_ctx);

    m_verify = verify;
    if (verify)
    {
        int rc = ca_path.empty()
            ? SSL_CTX_set_default_verify_paths(m_ctx)
            : SSL_CTX_load_verify_locations(m_ctx, std::string(ca_path).c_str(), nullptr);
        if (rc <= 0)
        {
            std::string msg = "tls: failed to load CA file: ";
            msg += ca_path.empty() ? std::string_view("<system default>") : ca_path;
            LOG_ERROR(msg.c_str());
            SSL_CTX_free(m_ctx);
            m_ctx = nullptr;
            return false;
        }
        SSL_CTX_set_verify(m_ctx, SSL_VERIFY_PEER, nullptr);
    }
    else
    {
        SSL_CTX_set_verify(m_ctx, SSL_VERIFY_NONE, nullptr);
    }

    // mTLS client certificate
    if (!client_cert.empty() && !client_key.empty())
    {
        if (SSL_CTX_use_certificate_file(m_ctx, std::string(client_cert).c_str(), SSL_FILETYPE_PEM) <= 0)
        {
            LOG_ERROR(("tls: failed to load client certificate: " + std::string(client_cert)).c_str());
            SSL_CTX_free(m_ctx);
            m_ctx = nullptr;
            return false;
        }
        if (SSL_CTX_use_PrivateKey_file(m_ctx, std::string(client_key).c_str(), SSL_FILETYPE_PEM) <= 0)
        {
            LOG_ERROR(("tls: failed to load client key: " + std::string(client_key)).c_str());
            SSL_CTX_free(m_ctx);
            m_ctx = nullptr;
            return false;
        }
        if (!SSL_CTX_check_private_key(m_ctx))
        {
            LOG_ERROR("tls: client key does not match certificate");
            SSL_CTX_free(m_ctx);
            m_ctx = nullptr;
            return false;
        }
    }

    return true;
}

SSL* tls_context::create_ssl_client(std::string_view server_name) const
{
    if (!m_ctx)
        return nullptr;

    SSL* ssl = SSL_new(m_ctx);
    if (!ssl)
        return nullptr;

    // BIO memory pair for non-blocking I/O
    BIO* rbio = BIO_new(BIO_s_mem());
    BIO* wbio = BIO_new(BIO_s_mem());
    if (!rbio || !wbio)
    {
        BIO_free(rbio);
        BIO_free(wbio);
        SSL_free(ssl);
        return nullptr;
    }

    BIO_set_mem_eof_return(rbio, -1);
    BIO_set_mem_eof_return(wbio, -1);
    SSL_set_bio(ssl, rbio, wbio);

    if (!server_name.empty())
    {
        std::string name(server_name);
        unsigned char addr[sizeof(struct in6_addr)];
        bool is_ip = inet_pton(AF_INET, name.c_str(), addr) == 1
                  || inet_pton(AF_INET6, name.c_str(), addr) == 1;

        // SNI must not carry IP literals
        if (!is_ip)
            SSL_set_tlsext_host_name(ssl, name.c_str());

        if (m_verify)
        {
            X509_VERIFY_PARAM* param = SSL_get0_param(ssl);
            X509_VERIFY_PARAM_set_hostflags(param, X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);
            int ok = is_ip ? X509_VERIFY_PARAM_set1_ip_asc(param, name.c_str())
                           : X509_VERIFY_PARAM_set1_host(param, name.c_str(), name.size());
            if (ok != 1)
            {
                SSL_free(ssl);
                return nullptr;
            }
        }
    }

    SSL_set_connect_state(ssl);
    return ssl;
}

int tls_context::do_handshake(SSL* ssl)
{
    int ret = SSL_do_handshake(ssl);
    if (ret == 1)
        return 1;

    int err = SSL_get_error(ssl, ret);
    if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
        return 0;

    return -1;
}

int tls_context::ssl_read(SSL* ssl, char* buf, int len)
{
    int ret = SSL_read(ssl, buf, len);
    if (ret > 0)
        return ret;

    int err = SSL_get_error(ssl, ret);
    if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
        return 0;

    return -1;
}

int tls_context::ssl_write(SSL* ssl, const char* buf, int len)
{
    int ret = SSL_write(ssl, buf, len);
    if (ret > 0)
        return ret;

    int err = SSL_get_error(ssl, ret);
    if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
        return 0;

    return -1;
}

int tls_context::bio_read_out(SSL* ssl, char* buf, int len)
{
    BIO* wbio = SSL_get_wbio(ssl);
    if (!wbio)
        return -1;

    int ret = BIO_read(wbio, buf, len);
    if (ret > 0)
        return ret;
    if (BIO_should_retry(wbio))
        return 0;
    return -1;
}

int tls_context::bio_write_in(SSL* ssl, const char* buf, int len)
{
    BIO* rbio = SSL_get_rbio(ssl);
    if (!rbio)
        return -1;

    int ret = BIO_write(rbio, buf, len);
    if (ret > 0)
        return ret;
    if (BIO_should_retry(rbio))
        return 0;
    return -1;
}

bool tls_context::has_pending_out(SSL* ssl)
{
    BIO* wbio = SSL_get_wbio(ssl);
    return wbio && BIO_ctrl_pending(wbio) > 0;
}

void tls_context::free_ssl(SSL* ssl)
{
    if (ssl)
        SSL_free(ssl);
}

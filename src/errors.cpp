#include "errors.hpp"

namespace volley {

std::string describe(const std::exception_ptr& error) {
    if (!error) {
        return "no error";
    }

    // Most specific first
    try {
        std::rethrow_exception(error);
    } catch (const ConnectTimeout& e) {
        return std::string("ConnectTimeout: ") + e.what();
    } catch (const ReadTimeout& e) {
        return std::string("ReadTimeout: ") + e.what();
    } catch (const SSLError& e) {
        return std::string("SSLError: ") + e.what();
    } catch (const ConnectionError& e) {
        return std::string("ConnectionError: ") + e.what();
    } catch (const HTTPError& e) {
        return std::string("HTTPError: ") + e.what();
    } catch (const TooManyRedirects& e) {
        return std::string("TooManyRedirects: ") + e.what();
    } catch (const InvalidURL& e) {
        return std::string("InvalidURL: ") + e.what();
    } catch (const ChunkedEncodingError& e) {
        return std::string("ChunkedEncodingError: ") + e.what();
    } catch (const ContentDecodingError& e) {
        return std::string("ContentDecodingError: ") + e.what();
    } catch (const RequestException& e) {
        return std::string("RequestException: ") + e.what();
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

} // namespace volley

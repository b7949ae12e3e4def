#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "certview/certview.hpp"

namespace {

    using namespace certview;

    std::string format_time(cert::TimePoint tp) {
        const auto t = static_cast<std::time_t>(tp.time_since_epoch().count());
        std::tm tm{};
        gmtime_r(&t, &tm);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S UTC", &tm);
        return buf;
    }

    void print_extensions(const cert::Extensions &extensions) {
        for (const auto &ext : extensions) {
            std::cout << "    " << ext.oid.to_string() << (ext.critical ? " (critical)" : "")
                      << (ext.is_unsupported() ? " [raw]" : "") << "\n";
        }
    }

    void print_fingerprint(const hash::Result &fp) {
        if (fp.success) {
            std::cout << "Fingerprint (SHA-256): " << utils::to_colon_hex(fp.data) << "\n";
        }
    }

    bool dump_certificate(cert::ByteSpan der, const cert::ParseOptions &options) {
        auto parsed = cert::Certificate::parse(der, options);
        if (!parsed.success) {
            std::cerr << "certificate: " << cert::error_kind_name(parsed.kind) << ": " << parsed.error << "\n";
            return false;
        }
        const auto &c = parsed.value;
        std::cout << "Certificate v" << static_cast<uint32_t>(c.version()) + 1 << "\n";
        std::cout << "  Serial:  " << c.tbs().raw_serial_as_string() << "\n";
        std::cout << "  Issuer:  " << c.issuer().to_string() << "\n";
        std::cout << "  Subject: " << c.subject().to_string() << "\n";
        std::cout << "  Not before: " << format_time(c.validity().not_before) << "\n";
        std::cout << "  Not after:  " << format_time(c.validity().not_after) << "\n";
        std::cout << "  CA: " << (c.tbs().is_ca() ? "yes" : "no") << "\n";
        if (const auto *san = c.tbs().subject_alternative_name()) {
            for (const auto &name : san->general_names) {
                std::cout << "  SAN: " << name.text() << "\n";
            }
        }
        std::cout << "  Extensions: " << c.extensions().size() << "\n";
        print_extensions(c.extensions());
        print_fingerprint(c.fingerprint());
        return true;
    }

    bool dump_crl(cert::ByteSpan der, const cert::ParseOptions &options) {
        auto parsed = cert::CertificateRevocationList::parse(der, options);
        if (!parsed.success) {
            std::cerr << "crl: " << cert::error_kind_name(parsed.kind) << ": " << parsed.error << "\n";
            return false;
        }
        const auto &crl = parsed.value;
        std::cout << "CRL v" << static_cast<uint32_t>(crl.version()) + 1 << "\n";
        std::cout << "  Issuer: " << crl.issuer().to_string() << "\n";
        std::cout << "  Last update: " << format_time(crl.last_update()) << "\n";
        if (auto next = crl.next_update()) {
            std::cout << "  Next update: " << format_time(*next) << "\n";
        }
        if (auto number = crl.crl_number()) {
            std::cout << "  CRL number: " << number->get_str() << "\n";
        }
        for (const auto &entry : crl.revoked()) {
            std::cout << "  Revoked " << entry.raw_serial_as_string() << " at " << format_time(entry.revocation_date);
            if (auto reason = entry.reason_code()) {
                std::cout << " (" << cert::crl_reason_name(*reason) << ")";
            }
            std::cout << "\n";
        }
        print_fingerprint(crl.fingerprint());
        return true;
    }

    bool dump_csr(cert::ByteSpan der, const cert::ParseOptions &options) {
        auto parsed = cert::CertificateRequest::parse(der, options);
        if (!parsed.success) {
            std::cerr << "csr: " << cert::error_kind_name(parsed.kind) << ": " << parsed.error << "\n";
            return false;
        }
        const auto &csr = parsed.value;
        std::cout << "Certification request\n";
        std::cout << "  Subject: " << csr.subject().to_string() << "\n";
        std::cout << "  Attributes: " << csr.attributes().size() << "\n";
        if (const auto *requested = csr.requested_extensions()) {
            std::cout << "  Requested extensions: " << requested->size() << "\n";
            print_extensions(*requested);
        }
        print_fingerprint(csr.fingerprint());
        return true;
    }

} // namespace

int main(int argc, char **argv) {
    std::vector<std::string_view> args(argv + 1, argv + argc);
    cert::ParseOptions options{};
    std::string path;
    for (auto arg : args) {
        if (arg == "-v") {
            spdlog::set_level(spdlog::level::debug);
        } else if (arg == "--strict") {
            options.strict = true;
        } else {
            path = std::string(arg);
        }
    }
    if (path.empty()) {
        std::cerr << "usage: certview_dump [-v] [--strict] <file.pem|file.der>\n";
        return 2;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        std::cerr << "cannot open " << path << "\n";
        return 1;
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    const std::string_view text(reinterpret_cast<const char *>(bytes.data()), bytes.size());

    // The decoded block must outlive every view parsed from it.
    cert::PemBlock block{};
    cert::ByteSpan der(bytes.data(), bytes.size());
    if (cert::looks_like_pem(text)) {
        auto pem = cert::pem_decode(text);
        if (!pem.success) {
            std::cerr << "PEM: " << pem.error << "\n";
            return 1;
        }
        block = std::move(pem.block);
        der = cert::ByteSpan(block.data.data(), block.data.size());
        if (block.label == "X509 CRL") {
            return dump_crl(der, options) ? 0 : 1;
        }
        if (block.label == "CERTIFICATE REQUEST" || block.label == "NEW CERTIFICATE REQUEST") {
            return dump_csr(der, options) ? 0 : 1;
        }
        return dump_certificate(der, options) ? 0 : 1;
    }

    // Raw DER: try each structure in turn
    if (cert::Certificate::parse(der, options).success) {
        return dump_certificate(der, options) ? 0 : 1;
    }
    if (cert::CertificateRevocationList::parse(der, options).success) {
        return dump_crl(der, options) ? 0 : 1;
    }
    return dump_csr(der, options) ? 0 : 1;
}

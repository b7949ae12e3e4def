#pragma once

// Zero-copy DER decoding of X.509 certificates, CRLs and certification requests.

#include <certview/cert/asn1_common.hpp>
#include <certview/cert/asn1_utils.hpp>
#include <certview/cert/certificate.hpp>
#include <certview/cert/crl.hpp>
#include <certview/cert/csr.hpp>
#include <certview/cert/distinguished_name.hpp>
#include <certview/cert/error.hpp>
#include <certview/cert/extensions.hpp>
#include <certview/cert/oid_registry.hpp>
#include <certview/cert/pem.hpp>
#include <certview/cert/validity.hpp>
#include <certview/hash/algorithms.hpp>
#include <certview/utils/common.hpp>

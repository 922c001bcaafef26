/**
 * @file http.hxx
 * @brief Cookie attribute types, buffer utilities and the cookie type of the cxxcookie.
 */

#ifndef CXXCOOKIE_HTTP_HXX
#define CXXCOOKIE_HTTP_HXX

#include "attribute/attribute.hxx"

#include "utils/utils.hxx"

#include "cookie/cookie.hxx"

#endif // CXXCOOKIE_HTTP_HXX

#pragma once

#include <span>

#include <boost/multiprecision/cpp_int.hpp>

#include <quill/BinaryDataDeferredFormatCodec.h>
#include <quill/DeferredFormatCodec.h>

#include <mona/encode.hpp>

namespace mona::log {

struct hex_tag
{};

using hex = quill::BinaryData< hex_tag >;

/**
 * Token amounts are 256-bit integers and are printed in base ten.
 */
struct amount
{
  boost::multiprecision::uint256_t value;
};

} // namespace mona::log

template<>
struct fmtquill::formatter< mona::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const mona::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                mona::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< mona::log::hex >: quill::BinaryDataDeferredFormatCodec< mona::log::hex >
{};

template<>
struct fmtquill::formatter< mona::log::amount >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const mona::log::amount& a, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "{}", a.value.str() );
  }
};

template<>
struct quill::Codec< mona::log::amount >: quill::DeferredFormatCodec< mona::log::amount >
{};

#pragma once

#include <array>
#include <memory>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace mona::memory {

template< typename T, typename U >
  requires( std::is_pointer_v< T > && std::is_trivially_copyable_v< std::remove_pointer_t< T > > )
T pointer_cast( U* p )
{
  return reinterpret_cast< T >( p ); // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
}

template< std::ranges::contiguous_range T >
std::span< const std::byte > as_bytes( const T& t )
{
  return std::as_bytes( std::span( t ) );
}

template< typename T, std::size_t N >
  requires( std::is_trivially_copyable_v< T > )
inline std::span< const std::byte > as_bytes( const std::array< T, N >& a )
{
  return std::as_bytes( std::span< const T, std::dynamic_extent >( a.data(), a.size() ) );
}

inline std::span< const std::byte > as_bytes( const std::string& s )
{
  return std::as_bytes( std::span( s ) );
}

inline std::span< const std::byte > as_bytes( std::string_view sv )
{
  return std::as_bytes( std::span( sv ) );
}

template< typename T >
  requires( !std::ranges::range< T > && std::is_trivially_copyable_v< T > )
inline std::span< const std::byte > as_bytes( const T& t )
{
  return std::as_bytes( std::span( std::addressof( t ), 1 ) );
}

template< typename T >
  requires std::is_trivially_copyable_v< T >
inline std::span< std::byte > as_writable_bytes( T& t )
{
  return std::as_writable_bytes( std::span( std::addressof( t ), 1 ) );
}

template< typename T, std::size_t N >
  requires( std::is_trivially_copyable_v< T > )
inline std::span< std::byte > as_writable_bytes( std::array< T, N >& a )
{
  return std::as_writable_bytes( std::span< T, std::dynamic_extent >( a.data(), a.size() ) );
}

inline std::string_view as_string_view( std::span< const std::byte > bytes ) noexcept
{
  return std::string_view( pointer_cast< const char* >( bytes.data() ), bytes.size() );
}

/**
 * Appends the byte representation of each span to a single buffer.
 */
inline std::vector< std::byte > concat( std::initializer_list< std::span< const std::byte > > parts )
{
  std::vector< std::byte > buffer;

  std::size_t size = 0;
  for( const auto& part: parts )
    size += part.size();

  buffer.reserve( size );

  for( const auto& part: parts )
    buffer.insert( buffer.end(), part.begin(), part.end() );

  return buffer;
}

} // namespace mona::memory

#include <comitia/record/record.hpp>

#include <algorithm>
#include <utility>

namespace comitia::record {

namespace {

entry split( std::string_view text ) noexcept
{
  auto separator = text.find( key_separator );
  if( separator == std::string_view::npos )
    return { .key = {}, .value = {} };

  return { .key = text.substr( 0, separator ), .value = text.substr( separator + 1 ) };
}

bool valid_key( std::string_view key ) noexcept
{
  return !key.empty() && key.find( entry_delimiter ) == std::string_view::npos
         && key.find( key_separator ) == std::string_view::npos;
}

bool valid_value( std::string_view value ) noexcept
{
  return value.find( entry_delimiter ) == std::string_view::npos
         && value.find( key_separator ) == std::string_view::npos;
}

template< typename Callback >
void scan( std::string_view data, Callback&& callback )
{
  std::size_t position = 0;
  while( position < data.size() )
  {
    auto end = data.find( entry_delimiter, position );
    if( end == std::string_view::npos )
      end = data.size();

    if( end > position )
      callback( data.substr( position, end - position ) );

    position = end + 1;
  }
}

} // namespace

record::record( std::size_t capacity ) noexcept:
    _capacity( capacity )
{}

record::record( std::string data, std::size_t capacity ) noexcept:
    _data( std::move( data ) ),
    _capacity( capacity )
{}

result< record > record::parse( std::string_view text, std::size_t capacity ) noexcept
{
  if( text.size() > capacity )
    return std::unexpected( record_errc::capacity_exceeded );

  return record( std::string( text ), capacity );
}

std::optional< std::string_view > record::find( std::string_view key ) const noexcept
{
  std::optional< std::string_view > found;

  scan( _data,
        [ & ]( std::string_view text )
        {
          if( found )
            return;

          if( auto e = split( text ); !e.key.empty() && e.key == key )
            found = e.value;
        } );

  return found;
}

bool record::contains( std::string_view key ) const noexcept
{
  return find( key ).has_value();
}

result< record > record::rewrite( std::string_view key, std::string_view value ) const
{
  const entry e{ .key = key, .value = value };
  return rewrite( std::span< const entry >( &e, 1 ) );
}

result< record > record::rewrite( std::span< const entry > fields ) const
{
  builder b( _capacity );
  std::vector< bool > matched( fields.size(), false );

  scan( _data,
        [ & ]( std::string_view text )
        {
          if( !b.empty() )
            b.append_separator();

          auto e  = split( text );
          auto it = std::ranges::find( fields, e.key, &entry::key );

          if( !e.key.empty() && it != fields.end() )
          {
            b.append_entry( it->key, it->value );
            matched[ std::distance( fields.begin(), it ) ] = true;
          }
          else
            b.append_raw( text );
        } );

  for( std::size_t i = 0; i < fields.size(); ++i )
  {
    if( matched[ i ] )
      continue;

    if( !b.empty() )
      b.append_separator();

    b.append_entry( fields[ i ].key, fields[ i ].value );
  }

  return std::move( b ).finish();
}

result< record > record::update( std::string_view key, std::string_view value ) const
{
  if( !contains( key ) )
    return std::unexpected( record_errc::missing_entry );

  return rewrite( key, value );
}

result< record > record::append_entry( std::string_view key, std::string_view value ) const
{
  builder b( _capacity );
  b.append_raw( _data );

  if( !b.empty() )
    b.append_separator();

  b.append_entry( key, value );
  return std::move( b ).finish();
}

result< record > record::erase( std::string_view key ) const
{
  builder b( _capacity );

  scan( _data,
        [ & ]( std::string_view text )
        {
          if( auto e = split( text ); !e.key.empty() && e.key == key )
            return;

          if( !b.empty() )
            b.append_separator();

          b.append_raw( text );
        } );

  return std::move( b ).finish();
}

std::vector< entry > record::entries() const
{
  std::vector< entry > result;

  scan( _data,
        [ & ]( std::string_view text )
        {
          if( auto e = split( text ); !e.key.empty() )
            result.push_back( e );
        } );

  return result;
}

std::string_view record::data() const noexcept
{
  return _data;
}

std::size_t record::size() const noexcept
{
  return _data.size();
}

std::size_t record::capacity() const noexcept
{
  return _capacity;
}

bool record::empty() const noexcept
{
  return _data.empty();
}

builder::builder( std::size_t capacity ):
    _capacity( capacity )
{
  _buffer.reserve( capacity );
}

void builder::append_entry( std::string_view key, std::string_view value )
{
  if( !valid_key( key ) )
    return fail( record_errc::invalid_key );

  if( !valid_value( value ) )
    return fail( record_errc::invalid_value );

  if( !fits( key.size() + 1 + value.size() ) )
    return fail( record_errc::capacity_exceeded );

  _buffer.append( key );
  _buffer.push_back( key_separator );
  _buffer.append( value );
}

void builder::append_separator()
{
  if( !fits( 1 ) )
    return fail( record_errc::capacity_exceeded );

  _buffer.push_back( entry_delimiter );
}

void builder::append_raw( std::string_view text )
{
  if( !fits( text.size() ) )
    return fail( record_errc::capacity_exceeded );

  _buffer.append( text );
}

bool builder::empty() const noexcept
{
  return _buffer.empty();
}

result< record > builder::finish() &&
{
  if( _error != record_errc::ok )
    return std::unexpected( _error );

  return record( std::move( _buffer ), _capacity );
}

void builder::fail( record_errc e ) noexcept
{
  if( _error == record_errc::ok )
    _error = e;
}

bool builder::fits( std::size_t length ) const noexcept
{
  return _error == record_errc::ok && _buffer.size() + length <= _capacity;
}

std::uint8_t read_count( const record& r, std::string_view key ) noexcept
{
  return read_number< std::uint8_t >( r, key ).value_or( 0 );
}

} // namespace comitia::record

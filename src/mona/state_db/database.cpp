#include <mona/log.hpp>
#include <mona/state_db/database.hpp>

#include <cstdint>
#include <fstream>
#include <utility>
#include <vector>

#include <boost/archive/archive_exception.hpp>
#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/serialization/utility.hpp>
#include <boost/serialization/vector.hpp>

namespace mona::state_db {

namespace {

constexpr std::uint32_t snapshot_version = 1;

struct snapshot
{
  std::uint32_t version  = snapshot_version;
  std::uint64_t revision = 0;
  std::vector< std::pair< std::vector< std::byte >, std::vector< std::byte > > > objects;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & this->version;
    ar & revision;
    ar & objects;
  }
};

} // namespace

database::database() noexcept {}

database::~database()
{
  if( auto error = close(); error )
    LOG_ERROR( mona::log::instance(), "Failed to close state database: {}", error.message() );
}

std::error_code database::open( genesis_init_function init, const std::optional< std::filesystem::path >& path )
{
  if( _root )
    return state_db_errc::already_open;

  _root = std::make_shared< state_delta >();

  if( path && std::filesystem::exists( *path ) )
  {
    if( auto error = load_snapshot( *path ); error )
    {
      _root.reset();
      return error;
    }
  }
  else
  {
    state_node_ptr root = std::make_shared< permanent_state_node >( _root );
    init( root );
  }

  _path = path;

  return state_db_errc::ok;
}

std::error_code database::close()
{
  if( !_root )
    return state_db_errc::ok;

  // The root stays open on failure so the caller can retry
  if( _path )
  {
    if( auto error = store_snapshot( *_path ); error )
      return error;
  }

  _root.reset();
  _path.reset();

  return state_db_errc::ok;
}

bool database::is_open() const noexcept
{
  return static_cast< bool >( _root );
}

permanent_state_node_ptr database::root() const
{
  if( _root )
    return std::make_shared< permanent_state_node >( _root );

  return permanent_state_node_ptr();
}

std::error_code database::load_snapshot( const std::filesystem::path& path )
{
  std::ifstream stream( path, std::ios::binary );
  if( !stream )
    return state_db_errc::unreadable_snapshot;

  snapshot s;

  try
  {
    boost::archive::binary_iarchive archive( stream );
    archive >> s;
  }
  catch( const boost::archive::archive_exception& e )
  {
    LOG_ERROR( mona::log::instance(), "Could not read snapshot {}: {}", path.string(), e.what() );
    return state_db_errc::unreadable_snapshot;
  }

  if( s.version != snapshot_version )
    return state_db_errc::incompatible_snapshot;

  for( auto& [ key, value ]: s.objects )
    _root->objects().insert_or_assign( std::move( key ), std::move( value ) );

  _root->set_revision( s.revision );

  LOG_INFO( mona::log::instance(),
            "Loaded {} objects at revision {} from {}",
            _root->objects().size(),
            s.revision,
            path.string() );

  return state_db_errc::ok;
}

std::error_code database::store_snapshot( const std::filesystem::path& path ) const
{
  snapshot s;
  s.revision = _root->revision();

  const auto& objects = _root->objects();
  s.objects.reserve( objects.size() );
  for( const auto& [ key, value ]: objects )
    s.objects.emplace_back( key, value );

  auto temporary_path = path;
  temporary_path += ".tmp";

  auto discard = [ & ]()
  {
    std::error_code ignored;
    std::filesystem::remove( temporary_path, ignored );
    return state_db_errc::unwritable_snapshot;
  };

  try
  {
    std::ofstream stream( temporary_path, std::ios::binary | std::ios::trunc );
    if( !stream )
      return discard();

    {
      boost::archive::binary_oarchive archive( stream );
      archive << s;
    }

    stream.flush();
    if( !stream )
    {
      LOG_ERROR( mona::log::instance(), "Could not write snapshot {}", temporary_path.string() );
      stream.close();
      return discard();
    }
  }
  catch( const boost::archive::archive_exception& e )
  {
    LOG_ERROR( mona::log::instance(), "Could not write snapshot {}: {}", temporary_path.string(), e.what() );
    return discard();
  }

  std::error_code error;
  std::filesystem::rename( temporary_path, path, error );
  if( error )
  {
    LOG_ERROR( mona::log::instance(), "Could not move snapshot into place at {}: {}", path.string(), error.message() );
    return discard();
  }

  LOG_INFO( mona::log::instance(), "Wrote {} objects at revision {} to {}", s.objects.size(), s.revision, path.string() );

  return state_db_errc::ok;
}

} // namespace mona::state_db

// NOLINTBEGIN

#include <gtest/gtest.h>

#include <csignal>
#include <filesystem>
#include <fstream>

#include <sys/resource.h>

#include <mona/state_db/database.hpp>
#include <mona/state_db/error.hpp>

namespace {

mona::state_db::object_space test_space()
{
  mona::state_db::object_space space{};
  space.id = 1;
  return space;
}

const std::vector< std::byte > test_key{ std::byte{ 0x01 } };
const std::vector< std::byte > test_value{ std::byte{ 0x10 }, std::byte{ 0x11 } };

void genesis( mona::state_db::state_node_ptr& root )
{
  root->put( test_space(), test_key, test_value );
}

class database_test: public ::testing::Test
{
protected:
  void SetUp() override
  {
    _dir = std::filesystem::temp_directory_path() / ::testing::UnitTest::GetInstance()->current_test_info()->name();
    std::filesystem::remove_all( _dir );
    std::filesystem::create_directories( _dir );
    _snapshot = _dir / "state.bin";
  }

  void TearDown() override
  {
    std::filesystem::remove_all( _dir );
  }

  std::filesystem::path _dir;
  std::filesystem::path _snapshot;
};

} // namespace

TEST_F( database_test, in_memory )
{
  mona::state_db::database db;
  EXPECT_FALSE( db.is_open() );
  EXPECT_FALSE( db.root() );

  ASSERT_FALSE( db.open( &genesis ) );
  EXPECT_TRUE( db.is_open() );
  EXPECT_EQ( db.open( &genesis ), mona::state_db::state_db_errc::already_open );

  auto root = db.root();
  ASSERT_TRUE( root );
  if( auto value = root->get( test_space(), test_key ); value )
    EXPECT_TRUE( std::ranges::equal( *value, test_value ) );
  else
    ADD_FAILURE() << "genesis object is missing";

  EXPECT_FALSE( db.close() );
  EXPECT_FALSE( db.is_open() );
  EXPECT_FALSE( std::filesystem::exists( _snapshot ) );
}

TEST_F( database_test, snapshot )
{
  const std::vector< std::byte > key_2{ std::byte{ 0x02 } }, value_2{ std::byte{ 0x20 } };

  {
    mona::state_db::database db;
    ASSERT_FALSE( db.open( &genesis, _snapshot ) );

    auto node = db.root()->make_child();
    node->put( test_space(), key_2, value_2 );
    node->remove( test_space(), test_key );
    node->squash();
    db.root()->set_revision( 4 );

    ASSERT_FALSE( db.close() );
  }

  EXPECT_TRUE( std::filesystem::exists( _snapshot ) );

  mona::state_db::database db;
  bool genesis_called = false;
  ASSERT_FALSE( db.open(
    [ & ]( mona::state_db::state_node_ptr& )
    {
      genesis_called = true;
    },
    _snapshot ) );

  EXPECT_FALSE( genesis_called );

  auto root = db.root();
  EXPECT_EQ( root->revision(), 4 );
  EXPECT_FALSE( root->get( test_space(), test_key ) );
  if( auto value = root->get( test_space(), key_2 ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_2 ) );
  else
    ADD_FAILURE() << "snapshot object is missing";
}

TEST_F( database_test, unreadable_snapshot )
{
  {
    std::ofstream stream( _snapshot, std::ios::binary );
    stream << "this is not a snapshot";
  }

  mona::state_db::database db;
  EXPECT_EQ( db.open( &genesis, _snapshot ), mona::state_db::state_db_errc::unreadable_snapshot );
  EXPECT_FALSE( db.is_open() );
}

TEST_F( database_test, unwritable_snapshot )
{
  const std::vector< std::byte > key_2{ std::byte{ 0x02 } }, value_2{ std::byte{ 0x20 } };
  auto missing_dir = _dir / "missing";
  auto snapshot    = missing_dir / "state.bin";

  mona::state_db::database db;
  ASSERT_FALSE( db.open( &genesis, snapshot ) );

  auto node = db.root()->make_child();
  node->put( test_space(), key_2, value_2 );
  node->squash();
  db.root()->set_revision( 2 );

  EXPECT_EQ( db.close(), mona::state_db::state_db_errc::unwritable_snapshot );

  // A failed close keeps the state so it can be written once the path exists
  ASSERT_TRUE( db.is_open() );
  EXPECT_TRUE( db.root()->get( test_space(), key_2 ) );

  std::filesystem::create_directories( missing_dir );
  EXPECT_FALSE( db.close() );
  EXPECT_FALSE( db.is_open() );

  mona::state_db::database reopened;
  ASSERT_FALSE( reopened.open( &genesis, snapshot ) );
  EXPECT_EQ( reopened.root()->revision(), 2 );
  EXPECT_TRUE( reopened.root()->get( test_space(), key_2 ) );
  EXPECT_TRUE( reopened.root()->get( test_space(), test_key ) );
}

TEST_F( database_test, short_write )
{
  const std::vector< std::byte > large_value( 100 * 1'024, std::byte{ 0x42 } );
  const std::vector< std::byte > large_key{ std::byte{ 0x03 } };

  mona::state_db::database db;
  ASSERT_FALSE( db.open( &genesis, _snapshot ) );
  db.root()->put( test_space(), large_key, large_value );

  rlimit original{};
  ASSERT_EQ( ::getrlimit( RLIMIT_FSIZE, &original ), 0 );
  auto previous_handler = std::signal( SIGXFSZ, SIG_IGN );

  rlimit limited = original;
  limited.rlim_cur = 4'096;
  ASSERT_EQ( ::setrlimit( RLIMIT_FSIZE, &limited ), 0 );

  auto error = db.close();

  ::setrlimit( RLIMIT_FSIZE, &original );
  std::signal( SIGXFSZ, previous_handler );

  EXPECT_EQ( error, mona::state_db::state_db_errc::unwritable_snapshot );
  EXPECT_TRUE( db.is_open() );
  EXPECT_FALSE( std::filesystem::exists( _snapshot ) );
  EXPECT_FALSE( std::filesystem::exists( _dir / "state.bin.tmp" ) );

  EXPECT_FALSE( db.close() );
  EXPECT_FALSE( db.is_open() );

  mona::state_db::database reopened;
  ASSERT_FALSE( reopened.open( &genesis, _snapshot ) );
  if( auto value = reopened.root()->get( test_space(), large_key ); value )
    EXPECT_EQ( value->size(), large_value.size() );
  else
    ADD_FAILURE() << "large object is missing";
}

// NOLINTEND

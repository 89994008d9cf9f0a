////////////////////////////////////////////////////////////////////////////////
/// psi::sparse::range_index unit tests
////////////////////////////////////////////////////////////////////////////////

#include <psi/sparse/containers/range_index.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::sparse {
//------------------------------------------------------------------------------

namespace
{
    using entries_t = std::vector<range_index::entry>;

    bool holds( range_index const & index, entries_t const & expected )
    {
        return std::ranges::equal( index.entries(), expected );
    }
} // anonymous namespace

//==============================================================================
// Lookup
//==============================================================================

TEST( range_index, default_construction )
{
    range_index const idx;
    EXPECT_TRUE ( idx.empty() );
    EXPECT_EQ   ( idx.size(), 0 );
    EXPECT_EQ   ( idx.begin(), idx.end() );
    EXPECT_EQ   ( idx.find( 0 ), nullptr );
    EXPECT_FALSE( idx.overlaps( { 0, 100 } ) );
    EXPECT_TRUE ( idx.check_invariants() );
}

TEST( range_index, disjoint_insertion_is_sorted )
{
    range_index idx;
    idx.insert( { 20, 30 }, 1 );
    idx.insert( {  0, 10 }, 0 );
    idx.insert( { 40, 50 }, 2 );

    EXPECT_EQ  ( idx.size(), 3 );
    EXPECT_TRUE( holds( idx, { { { 0, 10 }, 0 }, { { 20, 30 }, 1 }, { { 40, 50 }, 2 } } ) );
    EXPECT_TRUE( idx.check_invariants() );
}

TEST( range_index, point_lookup )
{
    range_index idx;
    idx.insert( { 10, 20 }, 7 );
    idx.insert( { 30, 31 }, 8 );

    EXPECT_EQ( idx.find(  9 ), nullptr );
    ASSERT_NE( idx.find( 10 ), nullptr );
    EXPECT_EQ( idx.find( 10 )->key, 7 );
    EXPECT_EQ( idx.find( 19 )->key, 7 );
    EXPECT_EQ( idx.find( 20 ), nullptr ) << "ranges are half-open";
    EXPECT_EQ( idx.find( 25 ), nullptr );
    ASSERT_NE( idx.find( 30 ), nullptr );
    EXPECT_EQ( idx.find( 30 )->range, ( address_range{ 30, 31 } ) );
    EXPECT_EQ( idx.find( 31 ), nullptr );
    EXPECT_EQ( idx.find( ~address{ 0 } ), nullptr );

    EXPECT_EQ( idx.upper_bound(  0 ), idx.begin() );
    EXPECT_EQ( idx.upper_bound( 19 ), idx.begin() );
    EXPECT_EQ( idx.upper_bound( 20 ), idx.begin() + 1 );
    EXPECT_EQ( idx.upper_bound( 30 ), idx.begin() + 1 );
    EXPECT_EQ( idx.upper_bound( 31 ), idx.end() );
}

TEST( range_index, overlap_queries )
{
    range_index idx;
    idx.insert( { 10, 20 }, 0 );

    EXPECT_TRUE ( idx.overlaps( { 15, 16 } ) );
    EXPECT_TRUE ( idx.overlaps( {  0, 11 } ) );
    EXPECT_TRUE ( idx.overlaps( { 19, 40 } ) );
    EXPECT_TRUE ( idx.overlaps( {  0, 40 } ) );
    EXPECT_FALSE( idx.overlaps( {  0, 10 } ) ) << "touching is not overlapping";
    EXPECT_FALSE( idx.overlaps( { 20, 30 } ) ) << "touching is not overlapping";
    EXPECT_FALSE( idx.overlaps( { 15, 15 } ) ) << "empty queries overlap nothing";
    EXPECT_FALSE( idx.overlaps( { 18, 12 } ) ) << "reversed queries overlap nothing";
}

//==============================================================================
// Clipping insertion
//==============================================================================

TEST( range_index, insert_truncates_lower_neighbour )
{
    range_index idx;
    idx.insert( { 0, 10 }, 0 );
    idx.insert( { 5, 15 }, 1 );
    EXPECT_TRUE( holds( idx, { { { 0, 5 }, 0 }, { { 5, 15 }, 1 } } ) );
    EXPECT_TRUE( idx.check_invariants() );
}

TEST( range_index, insert_truncates_upper_neighbour )
{
    range_index idx;
    idx.insert( { 10, 20 }, 0 );
    idx.insert( {  5, 15 }, 1 );
    EXPECT_TRUE( holds( idx, { { { 5, 15 }, 1 }, { { 15, 20 }, 0 } } ) );
    EXPECT_TRUE( idx.check_invariants() );
}

TEST( range_index, insert_swallows_covered_entries )
{
    range_index idx;
    idx.insert( { 2, 4 }, 0 );
    idx.insert( { 6, 8 }, 1 );
    idx.insert( { 0, 10 }, 2 );
    EXPECT_TRUE( holds( idx, { { { 0, 10 }, 2 } } ) );

    idx.insert( { 0, 10 }, 3 );
    EXPECT_TRUE( holds( idx, { { { 0, 10 }, 3 } } ) ) << "exact replacement";
}

TEST( range_index, insert_clips_and_swallows_at_once )
{
    range_index idx;
    idx.insert( { 0,  4 }, 0 );
    idx.insert( { 5,  6 }, 1 );
    idx.insert( { 8, 12 }, 2 );
    idx.insert( { 2, 10 }, 3 );
    EXPECT_TRUE( holds( idx, { { { 0, 2 }, 0 }, { { 2, 10 }, 3 }, { { 10, 12 }, 2 } } ) );
    EXPECT_TRUE( idx.check_invariants() );
}

TEST( range_index, insert_splits_containing_entry )
{
    range_index idx;
    idx.insert( { 0, 20 }, 0 );
    idx.insert( { 5, 10 }, 1 );
    EXPECT_TRUE ( holds( idx, { { { 0, 5 }, 0 }, { { 5, 10 }, 1 }, { { 10, 20 }, 0 } } ) );
    EXPECT_FALSE( idx.check_invariants() ) << "both pieces of the split entry keep the key";
    EXPECT_TRUE ( idx.check_ordering  () );
}

TEST( range_index, reserved_inserts_do_not_reallocate )
{
    range_index idx;
    idx.insert( { 0, 100 }, 0 );
    idx.reserve_additional( 2 );
    auto const p_entries{ idx.entries().data() };

    idx.insert( { 40, 60 }, 1 ); // splits: two more entries
    EXPECT_EQ( idx.size(), 3 );
    EXPECT_EQ( idx.entries().data(), p_entries );
}

TEST( range_index, touching_entries_are_kept_apart )
{
    range_index idx;
    idx.insert( {  0, 10 }, 0 );
    idx.insert( { 10, 20 }, 1 );
    EXPECT_EQ  ( idx.size(), 2 );
    EXPECT_TRUE( idx.check_invariants() );
}

//==============================================================================
// Removal
//==============================================================================

TEST( range_index, erase )
{
    range_index idx;
    idx.insert( {  0, 10 }, 0 );
    idx.insert( { 20, 30 }, 1 );
    idx.insert( { 40, 50 }, 2 );

    idx.erase( { 12, 18 } );
    EXPECT_EQ( idx.size(), 3 ) << "erasing a gap is a no-op";
    idx.erase( { 5, 5 } );
    EXPECT_EQ( idx.size(), 3 ) << "erasing an empty range is a no-op";

    idx.erase( { 5, 25 } );
    EXPECT_TRUE( holds( idx, { { { 0, 5 }, 0 }, { { 25, 30 }, 1 }, { { 40, 50 }, 2 } } ) );

    idx.erase( { 40, 50 } );
    EXPECT_TRUE( holds( idx, { { { 0, 5 }, 0 }, { { 25, 30 }, 1 } } ) );

    idx.erase( { 26, 28 } );
    EXPECT_TRUE( holds( idx, { { { 0, 5 }, 0 }, { { 25, 26 }, 1 }, { { 28, 30 }, 1 } } ) );

    idx.clear();
    EXPECT_TRUE( idx.empty() );
}

//------------------------------------------------------------------------------
} // namespace psi::sparse
//------------------------------------------------------------------------------

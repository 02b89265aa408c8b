#define BOOST_TEST_MODULE EnergyAxis_suite
#include <boost/test/included/unit_test.hpp>

#include <cmath>
#include <stdexcept>
#include <vector>

#include "specstack/axis/EnergyAxis.hh"

using namespace specstack;

BOOST_AUTO_TEST_CASE( testFromEnergyBounds )
{
  const EnergyAxis ax = EnergyAxis::FromEnergyBounds(0.1, 10.0, 4, "energy");
  BOOST_CHECK_EQUAL( ax.nbin(), 4u );
  BOOST_CHECK_EQUAL( ax.name(), "energy" );
  BOOST_CHECK_EQUAL( ax.unit(), "TeV" );
  BOOST_CHECK_EQUAL( ax.emin(), 0.1 );
  BOOST_CHECK_EQUAL( ax.emax(), 10.0 );
  // log-spaced: half a decade per bin
  BOOST_CHECK_CLOSE( ax.hi(0), std::sqrt(10.0) * 0.1, 1e-9 );
  BOOST_CHECK_CLOSE( ax.edges()[2], 1.0, 1e-9 );
  BOOST_CHECK_CLOSE( ax.center(0), std::sqrt(ax.lo(0) * ax.hi(0)), 1e-12 );
}

BOOST_AUTO_TEST_CASE( testInvalidAxes )
{
  BOOST_CHECK_THROW( EnergyAxis(std::vector<double>{1.0}), std::invalid_argument );
  BOOST_CHECK_THROW( EnergyAxis(std::vector<double>{1.0, 1.0}), std::invalid_argument );
  BOOST_CHECK_THROW( EnergyAxis(std::vector<double>{2.0, 1.0}), std::invalid_argument );
  BOOST_CHECK_THROW( EnergyAxis::FromEnergyBounds(0.0, 1.0, 3), std::invalid_argument );
  BOOST_CHECK_THROW( EnergyAxis::FromEnergyBounds(1.0, 0.5, 3), std::invalid_argument );
  BOOST_CHECK_THROW( EnergyAxis::FromEnergyBounds(1.0, 10.0, 0), std::invalid_argument );
}

BOOST_AUTO_TEST_CASE( testFindBin )
{
  const EnergyAxis ax({1.0, 2.0, 4.0, 8.0});
  BOOST_CHECK_EQUAL( ax.FindBin(1.0), 0 );
  BOOST_CHECK_EQUAL( ax.FindBin(1.9), 0 );
  BOOST_CHECK_EQUAL( ax.FindBin(2.0), 1 );
  BOOST_CHECK_EQUAL( ax.FindBin(7.99), 2 );
  BOOST_CHECK_EQUAL( ax.FindBin(8.0), -1 );
  BOOST_CHECK_EQUAL( ax.FindBin(0.5), -1 );
}

BOOST_AUTO_TEST_CASE( testSquashSliceCopy )
{
  const EnergyAxis ax({1.0, 2.0, 4.0, 8.0}, "energy");

  const EnergyAxis sq = ax.Squash();
  BOOST_CHECK_EQUAL( sq.nbin(), 1u );
  BOOST_CHECK_EQUAL( sq.emin(), 1.0 );
  BOOST_CHECK_EQUAL( sq.emax(), 8.0 );

  const EnergyAxis sl = ax.Slice(1, 3);
  BOOST_CHECK_EQUAL( sl.nbin(), 2u );
  BOOST_CHECK_EQUAL( sl.emin(), 2.0 );
  BOOST_CHECK_EQUAL( sl.emax(), 8.0 );
  BOOST_CHECK_THROW( ax.Slice(2, 2), std::invalid_argument );
  BOOST_CHECK_THROW( ax.Slice(0, 4), std::invalid_argument );

  const EnergyAxis cp = ax.Copy("energy_true");
  BOOST_CHECK_EQUAL( cp.name(), "energy_true" );
  BOOST_CHECK( cp == ax );
  BOOST_CHECK( sl != ax );
}

BOOST_AUTO_TEST_CASE( testGroupIndices )
{
  const EnergyAxis fine({1.0, 2.0, 4.0, 8.0, 16.0});
  const EnergyAxis coarse({1.0, 4.0, 16.0});

  const auto idx = fine.GroupIndices(coarse);
  BOOST_REQUIRE_EQUAL( idx.size(), 4u );
  BOOST_CHECK_EQUAL( idx[0], 0u );
  BOOST_CHECK_EQUAL( idx[1], 0u );
  BOOST_CHECK_EQUAL( idx[2], 1u );
  BOOST_CHECK_EQUAL( idx[3], 1u );

  const auto all = fine.GroupIndices(fine.Squash());
  for (auto i : all) BOOST_CHECK_EQUAL( i, 0u );

  BOOST_CHECK_THROW( fine.GroupIndices(EnergyAxis({1.0, 3.0, 16.0})), std::invalid_argument );
  BOOST_CHECK_THROW( fine.GroupIndices(EnergyAxis({1.0, 4.0, 8.0})), std::invalid_argument );
}

#define BOOST_TEST_MODULE SpectrumDataset_suite
#include <boost/test/included/unit_test.hpp>

#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "specstack/datasets/SpectrumDataset.hh"
#include "specstack/stats/CashStatistic.hh"
#include "specstack/stats/StatType.hh"

BOOST_TEST_DONT_PRINT_LOG_VALUE(specstack::stats::StatType)

using namespace specstack;

namespace {

const EnergyAxis kReco({1.0, 2.0, 4.0, 8.0}, "energy");
const EnergyAxis kTrue({1.0, 2.0, 4.0, 8.0}, "energy_true");

ResponseKernel flat_response(double exposure = 1e12, double livetime = 100.0) {
  return ResponseKernel(BinnedSpectrum(kTrue, "cm2 s", exposure),
                        EDispKernel::FromDiagonalResponse(kTrue, kReco), livetime);
}

SpectrumDataset make_dataset(const std::string& name,
                             const std::vector<double>& counts,
                             const std::vector<double>& bkg) {
  SpectrumDataset ds(name);
  ds.set_counts(BinnedSpectrum(kReco, counts));
  ds.set_background_model(BackgroundModel(BinnedSpectrum(kReco, bkg)));
  ds.set_response(flat_response());
  ds.set_gti(GoodTimeIntervals(std::vector<TimeInterval>{{0.0, 100.0}}));
  return ds;
}

std::shared_ptr<SourceModel> make_powerlaw(double amplitude) {
  return std::make_shared<SourceModel>(
      "pl", std::make_shared<PowerLawSpectralModel>(2.0, amplitude, 1.0));
}

} // namespace

BOOST_AUTO_TEST_CASE( testDatasetName )
{
  const std::string n = MakeDatasetName();
  BOOST_CHECK_EQUAL( n.size(), 8u );
  BOOST_CHECK_EQUAL( n.find_first_not_of("0123456789abcdef"), std::string::npos );
  BOOST_CHECK_EQUAL( MakeDatasetName("crab"), "crab" );
  BOOST_CHECK_EQUAL( SpectrumDataset("crab").name(), "crab" );
}

BOOST_AUTO_TEST_CASE( testCreateEmpty )
{
  const SpectrumDataset ds = SpectrumDataset::Create(kReco, std::nullopt, "empty");
  BOOST_REQUIRE( ds.counts() );
  BOOST_CHECK_EQUAL( ds.counts()->Sum(), 0.0 );
  BOOST_REQUIRE( ds.background_model() );
  BOOST_CHECK_EQUAL( ds.Background().Sum(), 0.0 );
  BOOST_REQUIRE( ds.response() );
  BOOST_CHECK_EQUAL( ds.response()->exposure().Sum(), 0.0 );
  BOOST_CHECK_EQUAL( ds.response()->exposure().unit(), "cm2 s" );
  BOOST_CHECK( ds.response()->e_true() == kReco );
  BOOST_CHECK( ds.HasMaskSafe() );
  BOOST_CHECK( !ds.mask_safe().Any() );
  BOOST_REQUIRE( ds.gti() );
  BOOST_CHECK( ds.gti()->empty() );
  BOOST_CHECK( !ds.EnergyRange() );
  BOOST_CHECK_EQUAL( ds.stat_type(), stats::StatType::Cash );
}

BOOST_AUTO_TEST_CASE( testAnalysisAxis )
{
  SpectrumDataset ds("bare");
  BOOST_CHECK_THROW( ds.AnalysisAxis(), std::runtime_error );
  BOOST_CHECK_THROW( ds.mask_safe(), std::runtime_error );

  ds.set_background_model(BackgroundModel(BinnedSpectrum(kReco, "", 1.0)));
  BOOST_CHECK( ds.AnalysisAxis() == kReco );
  BOOST_CHECK_EQUAL( ds.mask_safe().Count(), 3u );

  BOOST_CHECK_THROW( ds.set_counts(BinnedSpectrum(kReco.Squash())), std::invalid_argument );
  BOOST_CHECK_THROW( ds.set_mask_safe(SpectrumMask::Full(kReco.Squash())), std::invalid_argument );
}

BOOST_AUTO_TEST_CASE( testPredictedCounts )
{
  SpectrumDataset ds = make_dataset("a", {4.0, 1.0, 0.0}, {2.0, 1.0, 0.0});
  BOOST_CHECK_EQUAL( ds.NpredSig().Sum(), 0.0 );
  BOOST_CHECK_CLOSE( ds.Npred()[0], 2.0, 1e-12 );
  BOOST_CHECK_CLOSE( ds.Excess()[0], 2.0, 1e-12 );

  ds.models().Add(make_powerlaw(1e-12));
  const BinnedSpectrum sig = ds.NpredSig();
  BOOST_CHECK_CLOSE( sig[0], 0.5, 1e-9 );
  BOOST_CHECK_CLOSE( ds.Npred()[0], 2.5, 1e-9 );

  ds.set_response(std::nullopt);
  BOOST_CHECK_THROW( ds.NpredSig(), std::runtime_error );

  SpectrumDataset no_bkg("x");
  no_bkg.set_counts(BinnedSpectrum(kReco));
  BOOST_CHECK_THROW( no_bkg.Background(), std::runtime_error );
  BOOST_CHECK_EQUAL( no_bkg.Npred().Sum(), 0.0 );
}

BOOST_AUTO_TEST_CASE( testStatistic )
{
  SpectrumDataset ds = make_dataset("a", {4.0, 1.0, 3.0}, {2.0, 1.0, 1.0});
  const stats::CashStatistic cash;

  const auto arr = ds.StatArray();
  BOOST_REQUIRE_EQUAL( arr.size(), 3u );
  BOOST_CHECK_CLOSE( arr[0], cash.EvaluateBin(4.0, 2.0), 1e-12 );
  BOOST_CHECK_EQUAL( arr[1], 0.0 );
  BOOST_CHECK_CLOSE( ds.StatSum(), arr[0] + arr[2], 1e-12 );

  ds.set_mask_fit(SpectrumMask(kReco, {true, true, false}));
  BOOST_CHECK_CLOSE( ds.StatSum(), arr[0], 1e-12 );

  ds.set_mask_safe(SpectrumMask(kReco, {false, true, true}));
  BOOST_CHECK_EQUAL( ds.Mask().Count(), 1u );
  BOOST_CHECK_EQUAL( ds.StatSum(), 0.0 );
}

BOOST_AUTO_TEST_CASE( testResiduals )
{
  const SpectrumDataset ds = make_dataset("a", {4.0, 1.0, 0.0}, {2.0, 1.0, 0.0});

  const BinnedSpectrum diff = ds.Residuals();
  BOOST_CHECK_EQUAL( diff[0], 2.0 );
  BOOST_CHECK_EQUAL( diff[2], 0.0 );

  const BinnedSpectrum rel = ds.Residuals("diff/model");
  BOOST_CHECK_EQUAL( rel[0], 1.0 );
  BOOST_CHECK_EQUAL( rel[2], 0.0 );   // 0/0

  const BinnedSpectrum sq = ds.Residuals("diff/sqrt(model)");
  BOOST_CHECK_CLOSE( sq[0], 2.0 / std::sqrt(2.0), 1e-12 );
  BOOST_CHECK_EQUAL( sq[2], 0.0 );

  BOOST_CHECK_THROW( ds.Residuals("ratio"), std::invalid_argument );
}

BOOST_AUTO_TEST_CASE( testRangeAndLivetime )
{
  SpectrumDataset ds = make_dataset("a", {1.0, 1.0, 1.0}, {0.0, 0.0, 0.0});
  ds.set_mask_safe(SpectrumMask(kReco, {false, true, true}));

  const auto range = ds.EnergyRange();
  BOOST_REQUIRE( range );
  BOOST_CHECK_EQUAL( range->first, 2.0 );
  BOOST_CHECK_EQUAL( range->second, 8.0 );

  BOOST_REQUIRE( ds.Livetime() );
  BOOST_CHECK_CLOSE( *ds.Livetime(), 100.0, 1e-12 );

  ds.set_gti(std::nullopt);
  ds.set_response(flat_response(1e12, 42.0));
  BOOST_CHECK_CLOSE( *ds.Livetime(), 42.0, 1e-12 );

  ds.set_response(std::nullopt);
  BOOST_CHECK( !ds.Livetime() );
}

BOOST_AUTO_TEST_CASE( testEvaluatorsFollowModels )
{
  SpectrumDataset ds = make_dataset("a", {0.0, 0.0, 0.0}, {0.0, 0.0, 0.0});
  const ModelHandle h1 = ds.models().Add(make_powerlaw(1e-12));
  const ModelHandle h2 = ds.models().Add(make_powerlaw(2e-12));

  BOOST_CHECK_CLOSE( ds.NpredSig()[0], 1.5, 1e-9 );
  BOOST_CHECK_CLOSE( ds.NpredSig(h2)[0], 1.0, 1e-9 );

  // a copy keeps its own evaluators once its models change
  SpectrumDataset copy(ds);
  BOOST_CHECK( copy.models().Remove(h1) );
  BOOST_CHECK_CLOSE( copy.NpredSig()[0], 1.0, 1e-9 );
  BOOST_CHECK_THROW( copy.NpredSig(h1), std::out_of_range );
  BOOST_CHECK_CLOSE( ds.NpredSig()[0], 1.5, 1e-9 );

  // a new model is picked up
  const ModelHandle h3 = copy.models().Add(make_powerlaw(4e-12));
  BOOST_CHECK_CLOSE( copy.NpredSig()[0], 3.0, 1e-9 );
  BOOST_CHECK_CLOSE( copy.NpredSig(h3)[0], 2.0, 1e-9 );

  // parameter changes invalidate the cached prediction
  copy.models().Get(h3).spectral().parameter("amplitude").value = 0.0;
  BOOST_CHECK_CLOSE( copy.NpredSig()[0], 1.0, 1e-9 );

  copy.models().Clear();
  BOOST_CHECK_EQUAL( copy.NpredSig().Sum(), 0.0 );
}

BOOST_AUTO_TEST_CASE( testFake )
{
  SpectrumDataset a = make_dataset("a", {0.0, 0.0, 0.0}, {20.0, 10.0, 5.0});
  SpectrumDataset b = a;
  a.Fake(42);
  b.Fake(42);
  for (std::size_t k = 0; k < 3; ++k) {
    BOOST_CHECK_EQUAL( (*a.counts())[k], (*b.counts())[k] );
    BOOST_CHECK_GE( (*a.counts())[k], 0.0 );
    BOOST_CHECK_EQUAL( (*a.counts())[k], std::floor((*a.counts())[k]) );
  }
}

BOOST_AUTO_TEST_CASE( testToImage )
{
  SpectrumDataset ds = make_dataset("a", {1.0, 2.0, 3.0}, {0.5, 0.5, 0.5});
  ds.set_mask_safe(SpectrumMask(kReco, {false, true, true}));

  const SpectrumDataset img = ds.ToImage("img");
  BOOST_CHECK_EQUAL( img.name(), "img" );
  BOOST_REQUIRE( img.counts() );
  BOOST_CHECK_EQUAL( img.counts()->nbin(), 1u );
  BOOST_CHECK_CLOSE( (*img.counts())[0], ds.counts()->Sum(ds.mask_safe()), 1e-12 );
  BOOST_CHECK_CLOSE( img.Background()[0], 1.0, 1e-12 );
  BOOST_CHECK( img.mask_safe()[0] );
  BOOST_CHECK_CLOSE( img.response()->exposure().Sum(), ds.response()->exposure().Sum(), 1e-12 );
  BOOST_CHECK_CLOSE( *img.Livetime(), 100.0, 1e-12 );
}

BOOST_AUTO_TEST_CASE( testSlice )
{
  SpectrumDataset ds = make_dataset("a", {1.0, 2.0, 3.0}, {0.5, 0.5, 0.5});
  ds.set_mask_safe(SpectrumMask(kReco, {false, true, true}));

  const SpectrumDataset sl = ds.SliceByIdx(1, 3, "sl");
  BOOST_CHECK_EQUAL( sl.counts()->nbin(), 2u );
  BOOST_CHECK_EQUAL( (*sl.counts())[0], 2.0 );
  BOOST_CHECK_EQUAL( sl.mask_safe().Count(), 2u );
  BOOST_CHECK_EQUAL( sl.Background().Sum(), 1.0 );
  BOOST_CHECK( sl.response()->edisp()->e_reco() == kReco.Slice(1, 3) );
}

BOOST_AUTO_TEST_CASE( testInfoAndSummary )
{
  SpectrumDataset ds = make_dataset("summary", {4.0, 6.0, 10.0}, {1.0, 2.0, 3.0});
  const DatasetInfo info = ds.Info();
  BOOST_CHECK_EQUAL( info.name, "summary" );
  BOOST_CHECK_CLOSE( info.n_on, 20.0, 1e-12 );
  BOOST_CHECK_CLOSE( info.background, 6.0, 1e-12 );
  BOOST_CHECK_CLOSE( info.excess, 14.0, 1e-12 );
  BOOST_CHECK_GT( info.significance, 0.0 );
  BOOST_REQUIRE( info.background_rate );
  BOOST_CHECK_CLOSE( *info.background_rate, 0.06, 1e-10 );
  BOOST_CHECK( !info.n_off );

  const std::string s = ds.ToString();
  BOOST_CHECK( s.find("SpectrumDataset") != std::string::npos );
  BOOST_CHECK( s.find("summary") != std::string::npos );
  BOOST_CHECK( s.find("cash") != std::string::npos );
}

BOOST_AUTO_TEST_CASE( testSummaryWithoutResponse )
{
  SpectrumDataset ds("noresp");
  ds.set_counts(BinnedSpectrum(kReco, std::vector<double>{1.0, 2.0, 3.0}));
  ds.models().Add(std::make_shared<SourceModel>("pl", std::make_shared<PowerLawSpectralModel>()));

  BOOST_CHECK_THROW( ds.NpredSig(), std::runtime_error );
  std::string s;
  BOOST_CHECK_NO_THROW( s = ds.ToString() );
  BOOST_CHECK( s.find("nan") != std::string::npos );
  BOOST_CHECK_NO_THROW( ds.Info() );
}

#define BOOST_TEST_MODULE Stacking_suite
#include <boost/test/included/unit_test.hpp>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "specstack/datasets/SpectrumDatasetOnOff.hh"

using namespace specstack;

namespace {

const EnergyAxis kReco({1.0, 2.0, 4.0, 8.0}, "energy");
const EnergyAxis kTrue({1.0, 2.0, 4.0, 8.0}, "energy_true");

ResponseKernel make_response(double exposure, double livetime) {
  return ResponseKernel(BinnedSpectrum(kTrue, "cm2 s", exposure),
                        EDispKernel::FromDiagonalResponse(kTrue, kReco), livetime);
}

SpectrumDataset make_cash(const std::string& name,
                          const std::vector<double>& counts,
                          const std::vector<double>& bkg,
                          double tstart) {
  SpectrumDataset ds(name);
  ds.set_counts(BinnedSpectrum(kReco, counts));
  ds.set_background_model(BackgroundModel(BinnedSpectrum(kReco, bkg)));
  ds.set_response(make_response(1e12, 100.0));
  ds.set_gti(GoodTimeIntervals(std::vector<TimeInterval>{{tstart, tstart + 100.0}}));
  return ds;
}

SpectrumDatasetOnOff make_onoff(const std::string& name,
                                const std::vector<double>& on,
                                const std::vector<double>& off,
                                double acceptance, double acceptance_off) {
  SpectrumDatasetOnOff ds(name);
  ds.set_counts(BinnedSpectrum(kReco, on));
  ds.set_counts_off(BinnedSpectrum(kReco, off));
  ds.set_acceptance(acceptance);
  ds.set_acceptance_off(acceptance_off);
  ds.set_response(make_response(1e12, 100.0));
  ds.set_gti(GoodTimeIntervals(std::vector<TimeInterval>{{0.0, 100.0}}));
  return ds;
}

void check_same_values(const BinnedSpectrum& a, const BinnedSpectrum& b) {
  BOOST_REQUIRE_EQUAL( a.nbin(), b.nbin() );
  for (std::size_t k = 0; k < a.nbin(); ++k) BOOST_CHECK_CLOSE( a[k], b[k], 1e-10 );
}

} // namespace

// ---- Cash datasets ---------------------------------------------------------

BOOST_AUTO_TEST_CASE( testCashStackWithMasks )
{
  SpectrumDataset a = make_cash("a", {1.0, 2.0, 3.0}, {0.5, 0.5, 0.5}, 0.0);
  SpectrumDataset b = make_cash("b", {4.0, 5.0, 6.0}, {1.0, 1.0, 1.0}, 200.0);
  a.set_mask_safe(SpectrumMask(kReco, {false, true, true}));
  b.set_mask_safe(SpectrumMask(kReco, {true, true, false}));

  a.Stack(b);

  const BinnedSpectrum& c = *a.counts();
  BOOST_CHECK_EQUAL( c[0], 4.0 );
  BOOST_CHECK_EQUAL( c[1], 7.0 );
  BOOST_CHECK_EQUAL( c[2], 3.0 );

  const BinnedSpectrum bkg = a.Background();
  BOOST_CHECK_CLOSE( bkg[0], 1.0, 1e-12 );
  BOOST_CHECK_CLOSE( bkg[1], 1.5, 1e-12 );
  BOOST_CHECK_CLOSE( bkg[2], 0.5, 1e-12 );
  BOOST_CHECK_EQUAL( a.background_model()->norm(), 1.0 );

  BOOST_CHECK_EQUAL( a.mask_safe().Count(), 3u );
  BOOST_CHECK_CLOSE( a.response()->exposure()[0], 2e12, 1e-12 );
  BOOST_CHECK_CLOSE( *a.response()->livetime(), 200.0, 1e-12 );
  BOOST_CHECK_EQUAL( a.gti()->size(), 2u );
  BOOST_CHECK_CLOSE( *a.Livetime(), 200.0, 1e-12 );
  BOOST_CHECK_EQUAL( a.name(), "a" );
}

BOOST_AUTO_TEST_CASE( testCashStackWithEmptyIsIdentity )
{
  const SpectrumDataset a = make_cash("a", {1.0, 2.0, 3.0}, {0.5, 0.7, 0.9}, 0.0);
  const SpectrumDataset empty = SpectrumDataset::Create(kReco, kTrue, "empty");

  for (const SpectrumDataset& s : {Merged(a, empty), Merged(empty, a)}) {
    check_same_values(*s.counts(), *a.counts());
    check_same_values(s.Background(), a.Background());
    check_same_values(s.response()->exposure(), a.response()->exposure());
    BOOST_CHECK_EQUAL( s.mask_safe().Count(), 3u );
    BOOST_CHECK_CLOSE( *s.Livetime(), 100.0, 1e-12 );
    BOOST_CHECK_CLOSE( (*s.response()->edisp())(1, 1), 1.0, 1e-12 );
  }
}

BOOST_AUTO_TEST_CASE( testCashStackIsCommutative )
{
  SpectrumDataset a = make_cash("a", {1.0, 2.0, 3.0}, {0.5, 0.5, 0.5}, 0.0);
  SpectrumDataset b = make_cash("b", {4.0, 5.0, 6.0}, {1.0, 2.0, 1.0}, 200.0);
  a.set_mask_safe(SpectrumMask(kReco, {false, true, true}));

  const SpectrumDataset ab = Merged(a, b);
  const SpectrumDataset ba = Merged(b, a);
  check_same_values(*ab.counts(), *ba.counts());
  check_same_values(ab.Background(), ba.Background());
  check_same_values(ab.response()->exposure(), ba.response()->exposure());
  BOOST_CHECK( ab.mask_safe().data() == ba.mask_safe().data() );
  BOOST_CHECK_CLOSE( *ab.Livetime(), *ba.Livetime(), 1e-12 );
}

BOOST_AUTO_TEST_CASE( testCashStackIsAssociative )
{
  SpectrumDataset a = make_cash("a", {1.0, 2.0, 3.0}, {0.5, 0.5, 0.5}, 0.0);
  SpectrumDataset b = make_cash("b", {4.0, 5.0, 6.0}, {1.0, 2.0, 1.0}, 200.0);
  SpectrumDataset c = make_cash("c", {7.0, 1.0, 2.0}, {0.2, 0.3, 0.4}, 400.0);
  c.set_response(make_response(3e12, 50.0));

  for (int partial = 0; partial < 2; ++partial) {
    if (partial) {
      a.set_mask_safe(SpectrumMask(kReco, {false, true, true}));
      b.set_mask_safe(SpectrumMask(kReco, {true, false, false}));
      c.set_mask_safe(SpectrumMask(kReco, {false, true, false}));
    }
    const SpectrumDataset left  = Merged(Merged(a, b), c);
    const SpectrumDataset right = Merged(a, Merged(b, c));

    check_same_values(*left.counts(), *right.counts());
    check_same_values(left.Background(), right.Background());
    check_same_values(left.response()->exposure(), right.response()->exposure());
    BOOST_CHECK( left.mask_safe().data() == right.mask_safe().data() );
    for (std::size_t l = 0; l < kTrue.nbin(); ++l)
      for (std::size_t r = 0; r < kReco.nbin(); ++r)
        BOOST_CHECK_CLOSE( (*left.response()->edisp())(l, r), (*right.response()->edisp())(l, r), 1e-10 );
    BOOST_CHECK_CLOSE( *left.Livetime(), *right.Livetime(), 1e-12 );
  }
}

BOOST_AUTO_TEST_CASE( testCashStackFitMaskAndMeta )
{
  SpectrumDataset a = make_cash("a", {1.0, 2.0, 3.0}, {0.5, 0.5, 0.5}, 0.0);
  SpectrumDataset b = make_cash("b", {4.0, 5.0, 6.0}, {1.0, 1.0, 1.0}, 200.0);
  SpectrumDataset c = make_cash("c", {1.0, 1.0, 1.0}, {1.0, 1.0, 1.0}, 400.0);

  b.set_mask_fit(SpectrumMask(kReco, {true, true, false}));
  c.set_mask_fit(SpectrumMask(kReco, {false, true, true}));
  a.set_meta_table(MetaTable::FromRow({{"OBS_ID", 1}}));
  b.set_meta_table(MetaTable::FromRow({{"OBS_ID", 2}, {"ZEN_PNT", 20.0}}));

  a.Stack(b);
  BOOST_REQUIRE( a.mask_fit() );
  BOOST_CHECK_EQUAL( a.mask_fit()->Count(), 2u );
  a.Stack(c);
  BOOST_CHECK_EQUAL( a.mask_fit()->Count(), 1u );
  BOOST_CHECK( (*a.mask_fit())[1] );

  BOOST_REQUIRE( a.meta_table() );
  BOOST_CHECK_EQUAL( a.meta_table()->nrows(), 2u );
  BOOST_CHECK( a.meta_table()->column("ZEN_PNT")[0].is_null() );
  BOOST_CHECK_EQUAL( a.meta_table()->column("OBS_ID")[1].get<int>(), 2 );
}

BOOST_AUTO_TEST_CASE( testCashStackKeepsModels )
{
  SpectrumDataset a = make_cash("a", {1.0, 2.0, 3.0}, {0.5, 0.5, 0.5}, 0.0);
  const SpectrumDataset b = make_cash("b", {4.0, 5.0, 6.0}, {1.0, 1.0, 1.0}, 200.0);
  a.models().Add(std::make_shared<SourceModel>("pl", std::make_shared<PowerLawSpectralModel>()));
  const double before = a.NpredSig()[0];

  a.Stack(b);
  BOOST_CHECK_EQUAL( a.models().size(), 1u );
  // twice the exposure, twice the prediction
  BOOST_CHECK_CLOSE( a.NpredSig()[0], 2.0 * before, 1e-9 );
}

BOOST_AUTO_TEST_CASE( testCashStackErrors )
{
  SpectrumDataset a = make_cash("a", {1.0, 2.0, 3.0}, {0.5, 0.5, 0.5}, 0.0);

  SpectrumDataset no_counts("n");
  no_counts.set_background_model(BackgroundModel(BinnedSpectrum(kReco)));
  BOOST_CHECK( !no_counts.IsStackable() );
  BOOST_CHECK_THROW( a.Stack(no_counts), std::invalid_argument );

  SpectrumDataset other_axis("o");
  other_axis.set_counts(BinnedSpectrum(kReco.Squash()));
  BOOST_CHECK_THROW( a.Stack(other_axis), std::invalid_argument );

  const SpectrumDatasetOnOff onoff = make_onoff("on", {1.0, 1.0, 1.0}, {1.0, 1.0, 1.0}, 1.0, 1.0);
  BOOST_CHECK_THROW( a.Stack(onoff), std::invalid_argument );
}

// ---- On/off datasets -------------------------------------------------------

BOOST_AUTO_TEST_CASE( testOnOffStackIdentical )
{
  SpectrumDatasetOnOff a = make_onoff("a", {10.0, 20.0, 30.0}, {5.0, 5.0, 5.0}, 1.0, 2.0);
  const SpectrumDatasetOnOff b = a;
  a.Stack(b);

  BOOST_CHECK_EQUAL( (*a.counts())[2], 60.0 );
  BOOST_CHECK_EQUAL( (*a.counts_off())[2], 10.0 );
  for (std::size_t k = 0; k < 3; ++k) {
    BOOST_CHECK_EQUAL( (*a.acceptance())[k], 1.0 );
    BOOST_CHECK_CLOSE( a.Alpha()[k], 0.5, 1e-12 );
  }
  BOOST_CHECK_CLOSE( a.Excess()[0], 15.0, 1e-12 );
  BOOST_CHECK_CLOSE( a.Excess()[1], 35.0, 1e-12 );
  BOOST_CHECK_CLOSE( a.Excess()[2], 55.0, 1e-12 );
}

BOOST_AUTO_TEST_CASE( testOnOffStackWeightsAlpha )
{
  SpectrumDatasetOnOff a = make_onoff("a", {20.0, 20.0, 20.0}, {10.0, 10.0, 10.0}, 2.0, 4.0);
  const SpectrumDatasetOnOff b = make_onoff("b", {30.0, 30.0, 30.0}, {30.0, 30.0, 30.0}, 1.0, 4.0);
  const double excess_before = a.Excess().Sum() + b.Excess().Sum();

  a.Stack(b);

  // acceptance is reset, alpha is the off-count weighted mean
  for (std::size_t k = 0; k < 3; ++k) {
    BOOST_CHECK_EQUAL( (*a.acceptance())[k], 1.0 );
    BOOST_CHECK_CLOSE( a.Alpha()[k], (0.5 * 10.0 + 0.25 * 30.0) / 40.0, 1e-10 );
  }
  BOOST_CHECK_CLOSE( a.Excess().Sum(), excess_before, 1e-10 );
}

BOOST_AUTO_TEST_CASE( testOnOffStackWithMasks )
{
  SpectrumDatasetOnOff a = make_onoff("a", {10.0, 20.0, 30.0}, {5.0, 5.0, 5.0}, 1.0, 2.0);
  SpectrumDatasetOnOff b = make_onoff("b", {1.0, 2.0, 3.0}, {4.0, 4.0, 4.0}, 1.0, 2.0);
  a.set_mask_safe(SpectrumMask(kReco, {false, true, true}));
  b.set_mask_safe(SpectrumMask(kReco, {true, true, false}));

  a.Stack(b);
  BOOST_CHECK_EQUAL( (*a.counts())[0], 1.0 );
  BOOST_CHECK_EQUAL( (*a.counts())[1], 22.0 );
  BOOST_CHECK_EQUAL( (*a.counts())[2], 30.0 );
  BOOST_CHECK_EQUAL( (*a.counts_off())[0], 4.0 );
  BOOST_CHECK_EQUAL( (*a.counts_off())[1], 9.0 );
  BOOST_CHECK_EQUAL( (*a.counts_off())[2], 5.0 );
  BOOST_CHECK_EQUAL( a.mask_safe().Count(), 3u );
  for (std::size_t k = 0; k < 3; ++k) BOOST_CHECK_CLOSE( a.Alpha()[k], 0.5, 1e-10 );
}

BOOST_AUTO_TEST_CASE( testOnOffStackBinsWithoutOffCounts )
{
  SpectrumDatasetOnOff a = make_onoff("a", {1.0, 2.0, 3.0}, {0.0, 5.0, 5.0}, 1.0, 2.0);
  const SpectrumDatasetOnOff b = make_onoff("b", {1.0, 2.0, 3.0}, {0.0, 5.0, 5.0}, 1.0, 2.0);
  a.Stack(b);
  BOOST_CHECK_EQUAL( (*a.counts_off())[0], 0.0 );
  // empty bin takes the average alpha
  BOOST_CHECK_CLOSE( a.Alpha()[0], 0.5, 1e-10 );

  // no off counts at all: mean alpha of the safe ranges
  SpectrumDatasetOnOff c = make_onoff("c", {1.0, 1.0, 1.0}, {0.0, 0.0, 0.0}, 1.0, 2.0);
  const SpectrumDatasetOnOff d = make_onoff("d", {1.0, 1.0, 1.0}, {0.0, 0.0, 0.0}, 1.0, 4.0);
  c.Stack(d);
  BOOST_CHECK_CLOSE( c.Alpha()[1], (3 * 0.5 + 3 * 0.25) / 6.0, 1e-10 );
}

BOOST_AUTO_TEST_CASE( testOnOffStackWithEmptyIsIdentity )
{
  const SpectrumDatasetOnOff a = make_onoff("a", {10.0, 20.0, 30.0}, {5.0, 0.0, 8.0}, 1.0, 2.0);
  const SpectrumDatasetOnOff empty = SpectrumDatasetOnOff::Create(kReco, kTrue, "empty");

  for (const SpectrumDatasetOnOff& s : {Merged(a, empty), Merged(empty, a)}) {
    check_same_values(*s.counts(), *a.counts());
    check_same_values(*s.counts_off(), *a.counts_off());
    check_same_values(s.Alpha(), a.Alpha());
    check_same_values(s.Excess(), a.Excess());
    BOOST_CHECK_EQUAL( s.mask_safe().Count(), 3u );
  }
}

BOOST_AUTO_TEST_CASE( testOnOffStackIsCommutative )
{
  SpectrumDatasetOnOff a = make_onoff("a", {10.0, 20.0, 30.0}, {5.0, 6.0, 7.0}, 1.0, 2.0);
  SpectrumDatasetOnOff b = make_onoff("b", {3.0, 2.0, 1.0}, {9.0, 0.0, 4.0}, 1.0, 5.0);
  b.set_mask_safe(SpectrumMask(kReco, {true, true, false}));

  const SpectrumDatasetOnOff ab = Merged(a, b);
  const SpectrumDatasetOnOff ba = Merged(b, a);
  check_same_values(*ab.counts(), *ba.counts());
  check_same_values(*ab.counts_off(), *ba.counts_off());
  check_same_values(ab.Alpha(), ba.Alpha());
  check_same_values(ab.Excess(), ba.Excess());
  BOOST_CHECK_CLOSE( ab.StatSum(), ba.StatSum(), 1e-10 );
}

BOOST_AUTO_TEST_CASE( testOnOffStackIsAssociative )
{
  SpectrumDatasetOnOff a = make_onoff("a", {10.0, 20.0, 30.0}, {5.0, 6.0, 7.0}, 1.0, 2.0);
  SpectrumDatasetOnOff b = make_onoff("b", {3.0, 2.0, 1.0}, {9.0, 2.0, 4.0}, 1.0, 5.0);
  SpectrumDatasetOnOff c = make_onoff("c", {8.0, 8.0, 8.0}, {1.0, 3.0, 12.0}, 2.0, 3.0);

  for (int partial = 0; partial < 2; ++partial) {
    if (partial) {
      a.set_mask_safe(SpectrumMask(kReco, {true, true, false}));
      b.set_mask_safe(SpectrumMask(kReco, {false, true, true}));
      c.set_mask_safe(SpectrumMask(kReco, {true, false, true}));
    }
    const SpectrumDatasetOnOff left  = Merged(Merged(a, b), c);
    const SpectrumDatasetOnOff right = Merged(a, Merged(b, c));

    check_same_values(*left.counts(), *right.counts());
    check_same_values(*left.counts_off(), *right.counts_off());
    check_same_values(left.Alpha(), right.Alpha());
    check_same_values(left.Excess(), right.Excess());
    BOOST_CHECK( left.mask_safe().data() == right.mask_safe().data() );
  }
}

BOOST_AUTO_TEST_CASE( testFailedStackLeavesReceiverUnchanged )
{
  // true axis finer than the reco axis: without edisp there is no identity projection
  const EnergyAxis fine_true({1.0, 1.5, 2.0, 3.0, 4.0, 6.0, 8.0}, "energy_true");

  SpectrumDatasetOnOff a = make_onoff("a", {10.0, 20.0, 30.0}, {5.0, 5.0, 5.0}, 1.0, 2.0);
  a.set_response(ResponseKernel(BinnedSpectrum(fine_true, "cm2 s", 1e12), std::nullopt, 100.0));
  a.set_mask_safe(SpectrumMask(kReco, {false, true, true}));

  SpectrumDatasetOnOff b = make_onoff("b", {1.0, 2.0, 3.0}, {4.0, 4.0, 4.0}, 1.0, 4.0);
  b.set_response(ResponseKernel(BinnedSpectrum(fine_true, "cm2 s", 1e12),
                                EDispKernel::FromGauss(fine_true, kReco, 0.2), 100.0));

  const SpectrumDatasetOnOff before = a;
  BOOST_CHECK_THROW( a.Stack(b), std::invalid_argument );

  check_same_values(*a.counts(), *before.counts());
  check_same_values(*a.counts_off(), *before.counts_off());
  check_same_values(*a.acceptance(), *before.acceptance());
  check_same_values(*a.acceptance_off(), *before.acceptance_off());
  check_same_values(a.response()->exposure(), before.response()->exposure());
  BOOST_CHECK( !a.response()->edisp() );
  BOOST_CHECK( a.mask_safe().data() == before.mask_safe().data() );
  BOOST_CHECK_EQUAL( a.gti()->size(), 1u );

  // the reverse order fails the same way and leaves b untouched
  const SpectrumDatasetOnOff b_before = b;
  BOOST_CHECK_THROW( b.Stack(a), std::invalid_argument );
  check_same_values(*b.counts_off(), *b_before.counts_off());
  check_same_values(*b.acceptance(), *b_before.acceptance());
}

BOOST_AUTO_TEST_CASE( testOnOffStackErrors )
{
  SpectrumDatasetOnOff a = make_onoff("a", {1.0, 1.0, 1.0}, {1.0, 1.0, 1.0}, 1.0, 1.0);

  SpectrumDatasetOnOff no_off("n");
  no_off.set_counts(BinnedSpectrum(kReco));
  no_off.set_acceptance(1.0);
  no_off.set_acceptance_off(1.0);
  BOOST_CHECK( !no_off.IsStackable() );
  BOOST_CHECK_THROW( a.Stack(no_off), std::invalid_argument );

  const SpectrumDataset cash = a.ToSpectrumDataset("cash");
  BOOST_CHECK_THROW( a.Stack(cash), std::invalid_argument );
}

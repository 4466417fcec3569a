#include <set>
#include <algorithm>
#include "fengine_io_internals.hpp"

using namespace std;

namespace fengine_io {
#if 0
};  // pacify emacs c-mode!
#endif


// Disconnects the unit when it goes out of scope, so that the hardware connection is released
// on every exit path (including a collation_error propagating out of collate_band_tables()).
struct unit_connection : noncopyable {
    fengine_unit &unit;

    explicit unit_connection(fengine_unit &unit_) : unit(unit_) { }
    ~unit_connection() { unit.disconnect(); }
};


static bool _subband_start_less(const channel_subband &a, const channel_subband &b)
{
    return a.start < b.start;
}


// Collates a single unit.  Returns false (and sets 'cause') if the unit is unavailable.
static bool _collate_unit(fengine_unit &unit, const antenna_tuning &pair, const map<string,double> &sky_freqs,
			  const collation_initializer &ini_params, band_table &out, string &cause)
{
    unit_connection conn(unit);

    auto p = sky_freqs.find(pair.tuning);
    if (p == sky_freqs.end()) {
	cause = "no sky frequency for tuning '" + pair.tuning + "'";
	return false;
    }

    vector<channel_subband> subbands;

    if (!read_channel_subbands(unit, subbands, ini_params.emit_warnings)) {
	cause = "failed to query " + unit.get_hostname();
	return false;
    }

    // Subbands from different interfaces can interleave.
    std::stable_sort(subbands.begin(), subbands.end(), _subband_start_less);

    out.pair = pair;
    out.bands = map_frequency_bands(subbands, unit.get_nchan_tot(), unit.get_chan_bandwidth(), p->second);
    return true;
}


collation_result collate_band_tables(const unit_map &units, const map<string,double> &sky_freqs, const collation_initializer &ini_params)
{
    struct timeval tv0 = xgettimeofday();
    collation_result ret;

    for (const auto &kv: units) {
	const antenna_tuning &pair = kv.first;

	if (!kv.second)
	    throw runtime_error("fengine_io: collate_band_tables(): null unit for " + pair.str());

	band_table table;
	string cause;

	try {
	    if (_collate_unit(*kv.second, pair, sky_freqs, ini_params, table, cause))
		ret.band_tables[pair] = table;
	    else {
		ret.unavailable[pair] = cause;
		if (ini_params.emit_warnings)
		    cerr << ("fengine_io: warning: " + pair.str() + " is unavailable: " + cause + "\n");
	    }
	} catch (collation_error &e) {
	    if (ini_params.throw_exception_on_integrity_error)
		throw;

	    ret.failures[pair] = e.what();
	    cerr << ("fengine_io: " + pair.str() + ": " + e.what() + "\n");
	} catch (runtime_error &e) {
	    // Any other fault raised by a fengine_unit (e.g. transport) makes this unit unavailable.
	    ret.unavailable[pair] = e.what();
	    if (ini_params.emit_warnings)
		cerr << ("fengine_io: warning: " + pair.str() + " is unavailable: " + e.what() + "\n");
	}
    }

    struct timeval tv1 = xgettimeofday();

    if (ini_params.noisy) {
	stringstream ss;
	ss << "fengine_io: collated " << units.size() << " unit(s) in " << (1.0e-6 * usec_between(tv0,tv1)) << " sec: "
	   << ret.band_tables.size() << " ok, " << ret.unavailable.size() << " unavailable, "
	   << ret.failures.size() << " failed\n";
	cerr << ss.str();
    }

    return ret;
}


// -------------------------------------------------------------------------------------------------


unit_map make_unit_map(const vector<unit_table_entry> &entries, const unit_factory &factory)
{
    unit_map ret;
    set<antenna_tuning> seen;

    for (const unit_table_entry &e: entries) {
	antenna_tuning pair(e.antenna, e.tuning);

	if (!seen.insert(pair).second)
	    throw runtime_error("fengine_io: make_unit_map(): duplicate unit table entries for " + pair.str());

	shared_ptr<fengine_unit> u = factory(e);
	if (u)
	    ret[pair] = u;
    }

    return ret;
}


}  // namespace fengine_io

#include "fengine_io_internals.hpp"

using namespace std;

namespace fengine_io {
#if 0
};  // pacify emacs c-mode!
#endif


//
// Channel i of the F-Engine is centered at (i + 0.5 - nchan_tot/2) channel widths from the sky
// frequency.  A subband [start,stop) is assigned the center "channel" (start + width/2 + 0.5),
// and the half-channel is subtracted again when converting to frequency.  The two offsets
// cancel, but the expression is evaluated as written so that the published edges are
// bit-for-bit reproducible.
//
vector<frequency_band> map_frequency_bands(const vector<channel_subband> &subbands, int nchan_tot, double chan_bw, double sky_freq)
{
    const double center_chan = nchan_tot / 2.0;

    vector<frequency_band> ret(subbands.size());

    for (unsigned int i = 0; i < subbands.size(); i++) {
	const channel_subband &s = subbands[i];
	frequency_band &b = ret[i];

	double width = s.stop - s.start;
	double band_center_chan = width / 2.0 + s.start + 0.5;
	double band_center_freq = sky_freq + (band_center_chan - center_chan - 0.5) * chan_bw;

	b.index = i;
	b.channel_start = s.start;
	b.channel_stop = s.stop;
	b.address = s.dest;
	b.frequency_start = band_center_freq - chan_bw * width / 2.0;
	b.frequency_stop = band_center_freq + chan_bw * width / 2.0;
    }

    return ret;
}


}  // namespace fengine_io

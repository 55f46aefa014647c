/***********************************************************************************************************************
*                                                                                                                      *
* libbodehal                                                                                                           *
*                                                                                                                      *
* Copyright (c) 2012-2024 Andrew D. Zonenberg and contributors                                                         *
* All rights reserved.                                                                                                 *
*                                                                                                                      *
* Redistribution and use in source and binary forms, with or without modification, are permitted provided that the     *
* following conditions are met:                                                                                        *
*                                                                                                                      *
*    * Redistributions of source code must retain the above copyright notice, this list of conditions, and the         *
*      following disclaimer.                                                                                           *
*                                                                                                                      *
*    * Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the       *
*      following disclaimer in the documentation and/or other materials provided with the distribution.                *
*                                                                                                                      *
*    * Neither the name of the author nor the names of any contributors may be used to endorse or promote products     *
*      derived from this software without specific prior written permission.                                           *
*                                                                                                                      *
* THIS SOFTWARE IS PROVIDED BY THE AUTHORS "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED   *
* TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL *
* THE AUTHORS BE HELD LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES        *
* (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR       *
* BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT *
* (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE       *
* POSSIBILITY OF SUCH DAMAGE.                                                                                          *
*                                                                                                                      *
***********************************************************************************************************************/

/**
	@file
	@author Andrew D. Zonenberg
	@brief Implementation of TestWaveformSource
 */

#include "bodehal.h"
#include "TestWaveformSource.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

TestWaveformSource::TestWaveformSource(minstd_rand& rng)
	: m_rng(rng)
{
}

TestWaveformSource::~TestWaveformSource()
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Signal generation

/**
	@brief Generates a sinewave with AWGN added

	@param amplitude	P-P amplitude of the waveform in volts
	@param startphase	Starting phase in radians
	@param period		Period of the sine, in femtoseconds
	@param sampleperiod	Interval between samples, in femtoseconds
	@param depth		Total number of samples to generate
	@param noise_stdev	Standard deviation of the AWGN in volts, zero for a clean sine
 */
unique_ptr<UniformAnalogWaveform> TestWaveformSource::GenerateNoisySinewave(
	float amplitude,
	float startphase,
	float period,
	int64_t sampleperiod,
	size_t depth,
	float noise_stdev)
{
	auto ret = make_unique<UniformAnalogWaveform>();
	ret->m_timescale = sampleperiod;
	ret->Resize(depth);

	double radians_per_sample = 2 * M_PI * sampleperiod / period;

	//sin is +/- 1, so need to divide amplitude by 2 to get scaling factor
	float scale = amplitude / 2;

	if(noise_stdev > 0)
	{
		normal_distribution<> noise(0, noise_stdev);
		for(size_t i=0; i<depth; i++)
			ret->m_samples[i] = scale * sin(i*radians_per_sample + startphase) + noise(m_rng);
	}
	else
	{
		for(size_t i=0; i<depth; i++)
			ret->m_samples[i] = scale * sin(i*radians_per_sample + startphase);
	}

	return ret;
}

/**
	@brief Emulates an ADC: clamps the waveform to the input range and rounds to the code step

	Sets WAVEFORM_CLIPPING if any sample was outside the range.

	@param wfm		Waveform to process in place
	@param range	Full scale range in volts
	@param offset	Vertical offset in volts (added to the signal before digitizing)
	@param bits		ADC resolution
 */
void TestWaveformSource::Quantize(UniformAnalogWaveform& wfm, float range, float offset, unsigned int bits)
{
	float codes = (1 << bits);
	float lsb = range / codes;
	float vmax = range / 2 - offset;
	float vmin = -range / 2 - offset;

	for(auto& s : wfm.m_samples)
	{
		if(s >= vmax)
		{
			s = vmax;
			wfm.m_flags |= WaveformBase::WAVEFORM_CLIPPING;
		}
		else if(s <= vmin)
		{
			s = vmin;
			wfm.m_flags |= WaveformBase::WAVEFORM_CLIPPING;
		}
		else
			s = round((s + offset) / lsb) * lsb - offset;
	}
}

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
	@brief Implementation of MeasurementExtractor
 */

#include "bodehal.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

MeasurementExtractor::MeasurementExtractor(double noiseFloor, double nyquistFraction)
	: m_noiseFloor(noiseFloor)
	, m_nyquistFraction(nyquistFraction)
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Amplitude

/**
	@brief Returns the number of samples covering the largest whole number of signal periods

	If less than one period was captured the whole waveform is used.
 */
size_t MeasurementExtractor::GetWholePeriodSampleCount(const UniformAnalogWaveform& wfm, double hz)
{
	size_t len = wfm.size();
	if( (wfm.m_timescale <= 0) || (hz <= 0) )
		return len;

	double samplesPerPeriod = FS_PER_SECOND / (hz * wfm.m_timescale);
	double periods = floor(len / samplesPerPeriod);
	if(periods < 1)
		return len;

	return min(len, static_cast<size_t>(round(periods * samplesPerPeriod)));
}

double MeasurementExtractor::GetMean(const UniformAnalogWaveform& wfm, size_t len)
{
	if(len == 0)
		return 0;

	double sum = 0;
	for(size_t i=0; i<len; i++)
		sum += wfm.m_samples[i];
	return sum / len;
}

/**
	@brief RMS of the first len samples with the DC component removed
 */
double MeasurementExtractor::GetACRms(const UniformAnalogWaveform& wfm, size_t len)
{
	if(len == 0)
		return 0;

	double mean = GetMean(wfm, len);
	double sum = 0;
	for(size_t i=0; i<len; i++)
	{
		double d = wfm.m_samples[i] - mean;
		sum += d*d;
	}
	return sqrt(sum / len);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Timing

/**
	@brief Interpolates the actual time of a threshold crossing between two samples

	@return Interpolated crossing time. 0=a, 1=a+1, fractional values are in between.
 */
float MeasurementExtractor::InterpolateTime(const UniformAnalogWaveform& wfm, size_t a, float voltage)
{
	//If the voltage isn't between the two points, abort
	float fa = wfm.m_samples[a];
	float fb = wfm.m_samples[a+1];
	bool ag = (fa > voltage);
	bool bg = (fb > voltage);
	if( (ag && bg) || (!ag && !bg) )
		return 0;

	//no need to divide by time, sample spacing is normalized to 1 timebase unit
	float slope = (fb - fa);
	float delta = voltage - fa;
	return delta / slope;
}

/**
	@brief Finds the times of rising threshold crossings, in femtoseconds

	A crossing only counts after the signal has been below threshold-hysteresis, so noise riding on a slow edge
	yields a single crossing.
 */
void MeasurementExtractor::FindRisingZeroCrossings(
	const UniformAnalogWaveform& wfm,
	float threshold,
	float hysteresis,
	vector<double>& edges)
{
	edges.clear();

	size_t len = wfm.size();
	double fscale = wfm.m_timescale;
	bool armed = false;
	for(size_t i=1; i<len; i++)
	{
		float v = wfm.m_samples[i];
		if(v < threshold - hysteresis)
			armed = true;

		if(armed && (v > threshold) && (wfm.m_samples[i-1] <= threshold))
		{
			double tfrac = InterpolateTime(wfm, i-1, threshold);
			edges.push_back(wfm.m_triggerPhase + fscale * (i - 1 + tfrac));
			armed = false;
		}
	}
}

/**
	@brief Wraps an angle to (-180, 180]
 */
double MeasurementExtractor::NormalizePhase(double degrees)
{
	double ret = fmod(degrees, 360);
	if(ret <= -180)
		ret += 360;
	else if(ret > 180)
		ret -= 360;
	return ret;
}

/**
	@brief Phase of the output relative to the input from matched rising crossings

	Each input crossing is paired with the nearest output crossing. The per-pair phases are averaged on the unit
	circle so that values straddling +/-180 do not cancel out.

	@return Phase in degrees, positive when the output leads, or nullopt if there is nothing to pair
 */
optional<double> MeasurementExtractor::MeasurePhase(
	const vector<double>& inputEdges,
	const vector<double>& outputEdges,
	double hz)
{
	if(inputEdges.empty() || outputEdges.empty())
		return nullopt;

	double sumSin = 0;
	double sumCos = 0;
	for(auto tin : inputEdges)
	{
		auto it = lower_bound(outputEdges.begin(), outputEdges.end(), tin);
		double best = (it == outputEdges.end()) ? outputEdges.back() : *it;
		if(it != outputEdges.begin())
		{
			double prev = *(it - 1);
			if(fabs(tin - prev) < fabs(tin - best))
				best = prev;
		}

		//Output crossing earlier than the input means the output leads
		double radians = 2 * M_PI * hz * (tin - best) * SECONDS_PER_FS;
		sumSin += sin(radians);
		sumCos += cos(radians);
	}

	return NormalizePhase(atan2(sumSin, sumCos) * 180 / M_PI);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Extraction

/**
	@brief Computes gain and phase of the DUT from captures of its input and output

	@param input	Capture of the DUT input
	@param output	Capture of the DUT output, same timebase as the input
	@param hz		Stimulus frequency

	@throw InsufficientSignalError if the input is below the noise floor or the output is completely flat
 */
MeasurementResult MeasurementExtractor::Extract(
	const UniformAnalogWaveform& input,
	const UniformAnalogWaveform& output,
	double hz) const
{
	MeasurementResult ret;
	ret.m_frequency = hz;

	if(input.empty() || output.empty())
		throw InsufficientSignalError("Empty capture");

	size_t inLen = GetWholePeriodSampleCount(input, hz);
	size_t outLen = GetWholePeriodSampleCount(output, hz);

	ret.m_inputRms = GetACRms(input, inLen);
	ret.m_outputRms = GetACRms(output, outLen);

	if(ret.m_inputRms < m_noiseFloor)
	{
		throw InsufficientSignalError(
			string("Input amplitude ") + Unit(Unit::UNIT_VOLTS).PrettyPrint(ret.m_inputRms) + " RMS is below the noise floor");
	}
	if(ret.m_outputRms <= 0)
		throw InsufficientSignalError("No signal at all on the output");

	ret.m_gain = 20 * log10(ret.m_outputRms / ret.m_inputRms);

	//Sanity checks on the capture itself
	double fs = input.GetSampleRate();
	if( (fs > 0) && (hz > m_nyquistFraction * fs) )
	{
		LogWarning("%s is close to Nyquist at %s, result may be inaccurate\n",
			Unit(Unit::UNIT_HZ).PrettyPrint(hz).c_str(),
			Unit(Unit::UNIT_SAMPLERATE).PrettyPrint(fs).c_str());
		ret.m_lowConfidence = true;
	}
	if(input.GetDuration() * hz < FS_PER_SECOND)
	{
		LogWarning("Less than one period of %s captured\n", Unit(Unit::UNIT_HZ).PrettyPrint(hz).c_str());
		ret.m_lowConfidence = true;
	}

	//Phase only makes sense if the output rises above the noise
	if(ret.m_outputRms < m_noiseFloor)
	{
		LogDebug("Output below noise floor, no phase\n");
		return ret;
	}

	vector<double> inputEdges;
	vector<double> outputEdges;
	FindRisingZeroCrossings(input, GetMean(input, inLen), ret.m_inputRms / 2, inputEdges);
	FindRisingZeroCrossings(output, GetMean(output, outLen), ret.m_outputRms / 2, outputEdges);

	ret.m_phase = MeasurePhase(inputEdges, outputEdges, hz);
	if(!ret.m_phase)
	{
		LogDebug("No usable crossings, no phase\n");
		ret.m_lowConfidence = true;
	}

	return ret;
}

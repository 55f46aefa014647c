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
	@brief Implementation of FrequencySweep
 */

#include "bodehal.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

FrequencySweep::FrequencySweep(
	SignalSourceController& source,
	CaptureController& capture,
	const SweepConfiguration& config)
	: m_source(source)
	, m_capture(capture)
	, m_extractor(config.m_noiseFloor, config.m_nyquistFraction)
	, m_minFrequency(config.m_minFrequency)
	, m_maxFrequency(config.m_maxFrequency)
	, m_points(config.m_points)
	, m_linear(config.m_linear)
	, m_amplitude(config.m_amplitude)
	, m_stepTimeMs(config.m_stepTimeMs)
	, m_initialSettleMs(config.m_initialSettleMs)
	, m_retries(config.m_retries)
	, m_phase(config.m_phase)
	, m_inputChannel(config.m_inputChannel)
	, m_outputChannel(config.m_outputChannel)
	, m_stopRequested(false)
{
}

string FrequencySweep::GetNameOfState(PointState state)
{
	switch(state)
	{
		case POINT_PENDING:
			return "pending";
		case POINT_CONFIGURING:
			return "configuring";
		case POINT_CAPTURING:
			return "capturing";
		case POINT_EXTRACTING:
			return "extracting";
		case POINT_RECORDED:
			return "recorded";
		case POINT_FAILED:
			return "failed";
		default:
			return "unknown";
	}
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Frequency plan

/**
	@brief Generates count logarithmically spaced frequencies from fmin to fmax inclusive
 */
vector<double> FrequencySweep::GenerateLogFrequencies(double fmin, double fmax, size_t count)
{
	vector<double> ret;
	if( (count == 0) || (fmin <= 0) )
		return ret;
	if(count == 1)
	{
		ret.push_back(fmin);
		return ret;
	}

	double lmin = log10(fmin);
	double step = (log10(fmax) - lmin) / (count - 1);
	for(size_t i=0; i<count; i++)
		ret.push_back(pow(10, lmin + step*i));

	//Exact endpoints regardless of rounding
	ret.front() = fmin;
	ret.back() = fmax;
	return ret;
}

/**
	@brief Generates count evenly spaced frequencies from fmin to fmax inclusive
 */
vector<double> FrequencySweep::GenerateLinearFrequencies(double fmin, double fmax, size_t count)
{
	vector<double> ret;
	if(count == 0)
		return ret;
	if(count == 1)
	{
		ret.push_back(fmin);
		return ret;
	}

	double step = (fmax - fmin) / (count - 1);
	for(size_t i=0; i<count; i++)
		ret.push_back(fmin + step*i);
	ret.back() = fmax;
	return ret;
}

vector<double> FrequencySweep::GetFrequencies() const
{
	if(m_linear)
		return GenerateLinearFrequencies(m_minFrequency, m_maxFrequency, m_points);
	else
		return GenerateLogFrequencies(m_minFrequency, m_maxFrequency, m_points);
}

/**
	@brief Checks that the frequency plan is usable with the generator at hand

	@return False, after logging the reason, if it is not
 */
bool FrequencySweep::ValidateConfiguration()
{
	auto uhz = Unit(Unit::UNIT_HZ);

	if(m_minFrequency <= 0)
	{
		LogError("Minimum frequency must be positive\n");
		return false;
	}
	if(m_points == 0)
	{
		LogError("Need at least one frequency point\n");
		return false;
	}
	if( (m_points > 1) && (m_maxFrequency <= m_minFrequency) )
	{
		LogError("Maximum frequency %s must be above the minimum frequency %s\n",
			uhz.PrettyPrint(m_maxFrequency).c_str(),
			uhz.PrettyPrint(m_minFrequency).c_str());
		return false;
	}

	double fmax = m_source.GetMaxFrequency();
	if(m_maxFrequency > fmax)
	{
		LogError("Maximum frequency %s is above what the generator can do (%s)\n",
			uhz.PrettyPrint(m_maxFrequency).c_str(),
			uhz.PrettyPrint(fmax).c_str());
		return false;
	}

	return true;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Sweep

void FrequencySweep::SetState(size_t index, double hz, PointState state)
{
	LogTrace("Point %zu (%s): %s\n", index, Unit(Unit::UNIT_HZ).PrettyPrint(hz).c_str(), GetNameOfState(state).c_str());
	m_pointStatusSignal.emit(index, hz, state);
}

void FrequencySweep::Sleep(unsigned int ms)
{
	if(ms)
		this_thread::sleep_for(chrono::milliseconds(ms));
}

/**
	@brief Runs the whole sweep

	DeviceCommunicationError never leaves this function: it ends the sweep with m_aborted set. Results recorded
	before the abort are kept.
 */
SweepResult FrequencySweep::Run()
{
	SweepResult result;
	m_stopRequested = false;

	if(!ValidateConfiguration())
	{
		result.m_aborted = true;
		result.m_abortReason = "Invalid sweep configuration";
		return result;
	}

	auto freqs = GetFrequencies();
	for(size_t i=0; i<freqs.size(); i++)
		SetState(i, freqs[i], POINT_PENDING);

	try
	{
		m_source.Initialize(m_amplitude);
		m_capture.Initialize(m_amplitude);
	}
	catch(const DeviceCommunicationError& ex)
	{
		LogError("%s\n", ex.what());
		result.m_aborted = true;
		result.m_abortReason = ex.what();
		return result;
	}
	Sleep(m_initialSettleMs);

	LogNotice("Sweeping %zu points from %s to %s\n",
		freqs.size(),
		Unit(Unit::UNIT_HZ).PrettyPrint(freqs.front()).c_str(),
		Unit(Unit::UNIT_HZ).PrettyPrint(freqs.back()).c_str());

	for(size_t i=0; i<freqs.size(); i++)
	{
		if(m_stopRequested)
		{
			LogNotice("Sweep stopped after %zu of %zu points\n", i, freqs.size());
			result.m_stopped = true;
			break;
		}

		if(!MeasurePoint(i, freqs[i], result))
			break;
	}

	return result;
}

/**
	@brief Measures a single point, with retries

	@return False if the sweep must be aborted
 */
bool FrequencySweep::MeasurePoint(size_t index, double hz, SweepResult& result)
{
	auto uhz = Unit(Unit::UNIT_HZ);
	string reason;

	for(unsigned int attempt = 0; attempt <= m_retries; attempt++)
	{
		try
		{
			SetState(index, hz, POINT_CONFIGURING);
			if(attempt == 0)
			{
				m_source.SetFrequency(hz, m_amplitude);
				Sleep(m_stepTimeMs);
			}
			m_capture.PrepareForFrequency(hz);

			SetState(index, hz, POINT_CAPTURING);
			auto wfms = m_capture.CaptureChannels();

			SetState(index, hz, POINT_EXTRACTING);
			auto point = m_extractor.Extract(*wfms.first, *wfms.second, hz);
			if(!m_phase)
				point.m_phase.reset();

			//Next range follows what we just saw
			m_capture.UpdateExpectedAmplitude(m_inputChannel, point.m_inputRms * 2 * M_SQRT2);
			m_capture.UpdateExpectedAmplitude(m_outputChannel, point.m_outputRms * 2 * M_SQRT2);

			if(point.m_phase)
			{
				LogVerbose("%s: %.2f dB, %.1f deg\n", uhz.PrettyPrint(hz).c_str(), point.m_gain, *point.m_phase);
			}
			else
				LogVerbose("%s: %.2f dB\n", uhz.PrettyPrint(hz).c_str(), point.m_gain);

			result.m_recorded.push_back(point);
			SetState(index, hz, POINT_RECORDED);
			return true;
		}
		catch(const ClippingDetectedError& ex)
		{
			LogWarning("%s: %s (attempt %u)\n", uhz.PrettyPrint(hz).c_str(), ex.what(), attempt+1);
			m_capture.EscalateRange(ex.GetChannel());
			reason = ex.what();
		}
		catch(const CaptureTimeoutError& ex)
		{
			LogWarning("%s: %s (attempt %u)\n", uhz.PrettyPrint(hz).c_str(), ex.what(), attempt+1);
			reason = ex.what();
		}
		catch(const InsufficientSignalError& ex)
		{
			LogWarning("%s: %s\n", uhz.PrettyPrint(hz).c_str(), ex.what());
			reason = ex.what();
			break;
		}
		catch(const DeviceCommunicationError& ex)
		{
			LogError("%s: %s, aborting sweep\n", uhz.PrettyPrint(hz).c_str(), ex.what());
			result.m_failed.push_back(FailedPoint(index, hz, ex.what()));
			result.m_aborted = true;
			result.m_abortReason = ex.what();
			SetState(index, hz, POINT_FAILED);
			return false;
		}
	}

	result.m_failed.push_back(FailedPoint(index, hz, reason));
	SetState(index, hz, POINT_FAILED);
	return true;
}

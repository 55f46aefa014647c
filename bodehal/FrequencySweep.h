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
	@brief Declaration of FrequencySweep
 */

#ifndef FrequencySweep_h
#define FrequencySweep_h

/**
	@brief A frequency that could not be measured
 */
class FailedPoint
{
public:
	FailedPoint(size_t index = 0, double frequency = 0, const std::string& reason = "")
		: m_index(index)
		, m_frequency(frequency)
		, m_reason(reason)
	{}

	size_t m_index;
	double m_frequency;
	std::string m_reason;
};

/**
	@brief Everything a sweep produced
 */
class SweepResult
{
public:
	SweepResult()
		: m_aborted(false)
		, m_stopped(false)
	{}

	///@brief Measured points, in ascending frequency
	std::vector<MeasurementResult> m_recorded;

	///@brief Points given up on, in ascending frequency
	std::vector<FailedPoint> m_failed;

	///@brief True if a fatal error ended the sweep early
	bool m_aborted;
	std::string m_abortReason;

	///@brief True if RequestStop() ended the sweep early
	bool m_stopped;
};

/**
	@brief Steps the stimulus through a list of frequencies and measures the DUT at each one

	Points are processed one at a time in ascending order:

	PENDING -> CONFIGURING -> CAPTURING -> EXTRACTING -> RECORDED or FAILED

	Clipping and trigger timeouts are retried a bounded number of times, clipping with a larger range. A point whose
	input is below the noise floor fails at once. Losing the generator or the scope aborts the whole sweep.
 */
class FrequencySweep
{
public:
	FrequencySweep(SignalSourceController& source, CaptureController& capture, const SweepConfiguration& config);

	enum PointState
	{
		POINT_PENDING,
		POINT_CONFIGURING,
		POINT_CAPTURING,
		POINT_EXTRACTING,
		POINT_RECORDED,
		POINT_FAILED
	};

	static std::string GetNameOfState(PointState state);

	static std::vector<double> GenerateLogFrequencies(double fmin, double fmax, size_t count);
	static std::vector<double> GenerateLinearFrequencies(double fmin, double fmax, size_t count);

	std::vector<double> GetFrequencies() const;

	bool ValidateConfiguration();

	SweepResult Run();

	///@brief Ends the sweep before the next point. Safe to call from a signal handler.
	void RequestStop()
	{ m_stopRequested = true; }

	///@brief Emitted on every state change of a point with (index, frequency, state)
	sigc::signal<void(size_t, double, PointState)> signal_pointStatus()
	{ return m_pointStatusSignal; }

protected:
	bool MeasurePoint(size_t index, double hz, SweepResult& result);
	void SetState(size_t index, double hz, PointState state);
	void Sleep(unsigned int ms);

	SignalSourceController& m_source;
	CaptureController& m_capture;
	MeasurementExtractor m_extractor;

	double m_minFrequency;
	double m_maxFrequency;
	size_t m_points;
	bool m_linear;
	float m_amplitude;
	unsigned int m_stepTimeMs;
	unsigned int m_initialSettleMs;
	unsigned int m_retries;
	bool m_phase;
	size_t m_inputChannel;
	size_t m_outputChannel;

	std::atomic<bool> m_stopRequested;

	sigc::signal<void(size_t, double, PointState)> m_pointStatusSignal;
};

#endif

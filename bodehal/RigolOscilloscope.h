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
	@brief Declaration of RigolOscilloscope
 */

#ifndef RigolOscilloscope_h
#define RigolOscilloscope_h

/**
	@brief Driver for Rigol DS1000Z / MSO1000Z series oscilloscopes over LAN (port 5555)
 */
class RigolOscilloscope
	: public virtual Oscilloscope
	, public virtual SCPIInstrument
{
public:
	RigolOscilloscope(SCPITransport* transport);
	virtual ~RigolOscilloscope();

	//not copyable or assignable
	RigolOscilloscope(const RigolOscilloscope& rhs) = delete;
	RigolOscilloscope& operator=(const RigolOscilloscope& rhs) = delete;

public:
	virtual void FlushConfigCache() override;
	virtual bool IsOffline() override;

	//Channel configuration
	virtual bool IsChannelEnabled(size_t i) override;
	virtual void EnableChannel(size_t i) override;
	virtual void DisableChannel(size_t i) override;
	virtual float GetChannelVoltageRange(size_t i) override;
	virtual void SetChannelVoltageRange(size_t i, float range) override;
	virtual float GetChannelOffset(size_t i) override;
	virtual void SetChannelOffset(size_t i, float offset) override;

	//Timebase
	virtual int64_t GetTimebaseScale() override;
	virtual void SetTimebaseScale(int64_t fsPerDiv) override;
	virtual std::vector<int64_t> GetTimebaseScales() override;

	//Triggering
	virtual Oscilloscope::TriggerMode PollTrigger() override;
	virtual bool AcquireData() override;
	virtual void StartSingleTrigger() override;
	virtual void Stop() override;

	uint64_t GetSampleDepth();

	enum class CaptureFormat : int {
		BYTE = 0,	//one byte per point
		WORD = 1,	//two bytes per point, only the low 8 bits valid
		ASC = 2		//comma separated ASCII values
	};

	enum class CaptureType : int {
		NORMAL = 0,		//screen data
		MAXIMUM = 1,	//screen data while running, memory while stopped
		RAW = 2			//internal memory, only readable while stopped
	};

	struct CapturePreamble {
		CaptureFormat format;
		CaptureType type;
		std::uint_least32_t npoints;
		std::uint_least32_t averages;
		double sec_per_sample;
		double xorigin;
		double xreference;
		double yincrement;
		double yorigin;
		double yreference;
	};

	static std::optional<CapturePreamble> ParsePreamble(const std::string& reply);

	struct Model {
		std::string prefix;		//e.g. DS
		unsigned int number;	//e.g. 1054
		std::string suffix;		//e.g. Z
	};

	static std::optional<Model> ParseModel(const std::string& model);

protected:
	std::string Query(const std::string& cmd);
	std::optional<CapturePreamble> GetCapturePreamble();
	uint64_t GetPendingWaveformBlockLength();

	size_t m_analogChannelCount;
	Model m_modelInfo;

	//config cache
	std::map<size_t, float> m_channelOffsets;
	std::map<size_t, float> m_channelVoltageRanges;
	std::map<size_t, bool> m_channelsEnabled;
	std::optional<int64_t> m_timebase;
	std::optional<uint64_t> m_mdepth;

	//trigger state
	bool m_triggerArmed;
	std::uint_least32_t m_pointsWhenStarted;

public:
	static std::string GetDriverNameInternal();
	OSCILLOSCOPE_INITPROC(RigolOscilloscope)
};

#endif

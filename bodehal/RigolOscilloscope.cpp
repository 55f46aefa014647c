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
	@brief Implementation of RigolOscilloscope
 */

#include "bodehal.h"
#include "RigolOscilloscope.h"

using namespace std;

//Consecutive unanswered queries before we consider the scope gone
static const unsigned int MAX_MISSED_REPLIES = 3;

//Largest block the DS1000Z will return from one WAV:DATA? in BYTE mode
static const size_t MAX_BLOCK_POINTS = 250 * 1000;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

RigolOscilloscope::RigolOscilloscope(SCPITransport* transport)
	: SCPIDevice(transport)
	, SCPIInstrument(transport)
	, m_analogChannelCount(0)
	, m_triggerArmed(false)
	, m_pointsWhenStarted(0)
{
	auto model = ParseModel(m_model);
	if(!model)
	{
		LogError("Rigol model \"%s\" not supported, only DS1000Z / MSO1000Z series\n", m_model.c_str());
		return;
	}
	m_modelInfo = *model;

	//Last digit of the model number is the number of channels
	m_analogChannelCount = m_modelInfo.number % 10;
	LogDebug("Rigol %s: %zu analog channels\n", m_model.c_str(), m_analogChannelCount);

	//Rigol's standard color sequence
	static const char* colors[4] = { "#ffff00", "#00ffff", "#ff00ff", "#336699" };
	for(size_t i = 0; i < m_analogChannelCount; i++)
	{
		m_channels.push_back(new InstrumentChannel(
			this, string("CHAN") + to_string(i + 1), colors[i % 4], i));
	}

	//Configure acquisition modes
	m_transport->SendCommandQueued(":WAV:FORM BYTE");
	m_transport->SendCommandQueued(":WAV:MODE RAW");
	for(size_t i = 0; i < m_analogChannelCount; i++)
		m_transport->SendCommandQueued(":" + m_channels[i]->GetHwname() + ":VERN ON");

	//make sure all setup commands finish before we proceed
	m_transport->FlushCommandQueue();
}

RigolOscilloscope::~RigolOscilloscope()
{
}

string RigolOscilloscope::GetDriverNameInternal()
{
	return "rigol";
}

/**
	@brief Splits a model name such as "DS1054Z" into prefix, number and suffix

	@return The decoded model, or nullopt if it is not a DS1000Z / MSO1000Z series instrument
 */
optional<RigolOscilloscope::Model> RigolOscilloscope::ParseModel(const string& model)
{
	Model ret;

	char prefix[8] = "";
	int length = 0;
	if(1 != sscanf(model.c_str(), "%4[^0-9]%n", prefix, &length))
		return nullopt;
	ret.prefix = prefix;

	const char* cursor = model.c_str() + length;
	if(1 != sscanf(cursor, "%5u%n", &ret.number, &length))
		return nullopt;
	ret.suffix = string(cursor + length);

	if( (ret.prefix != "DS") && (ret.prefix != "MSO") )
		return nullopt;
	if(ret.number / 1000 != 1)
		return nullopt;
	if(ret.suffix.empty() || (ret.suffix[0] != 'Z'))
		return nullopt;

	return ret;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Helpers

/**
	@brief Sends a query, flushing queued setup commands first
 */
string RigolOscilloscope::Query(const string& cmd)
{
	return Trim(m_transport->SendCommandQueuedWithReply(cmd));
}

bool RigolOscilloscope::IsOffline()
{
	return !m_transport->IsConnected() || (m_transport->GetMissedReplyCount() >= MAX_MISSED_REPLIES);
}

void RigolOscilloscope::FlushConfigCache()
{
	m_channelOffsets.clear();
	m_channelVoltageRanges.clear();
	m_channelsEnabled.clear();
	m_timebase.reset();
	m_mdepth.reset();
}

/**
	@brief Parses a WAV:PRE? reply

	This is basically the same thing as a LeCroy WAVEDESC, but much less detailed.
 */
optional<RigolOscilloscope::CapturePreamble> RigolOscilloscope::ParsePreamble(const string& reply)
{
	CapturePreamble preamble {};
	int format;
	int type;

	auto parsed_length = sscanf(reply.c_str(),
		"%d,%d,%" SCNuLEAST32 ",%" SCNuLEAST32 ",%lf,%lf,%lf,%lf,%lf,%lf",
		&format,
		&type,
		&preamble.npoints,
		&preamble.averages,
		&preamble.sec_per_sample,
		&preamble.xorigin,
		&preamble.xreference,
		&preamble.yincrement,
		&preamble.yorigin,
		&preamble.yreference);

	if(parsed_length != 10)
		return nullopt;
	if( (format < 0) || (format > 2) || (type < 0) || (type > 2) )
		return nullopt;

	preamble.format = CaptureFormat(format);
	preamble.type = CaptureType(type);
	return preamble;
}

optional<RigolOscilloscope::CapturePreamble> RigolOscilloscope::GetCapturePreamble()
{
	auto reply = Query("WAV:PRE?");
	auto preamble = ParsePreamble(reply);
	if(!preamble)
	{
		LogError("Waveform data capture preamble parsing failed: \"%s\"\n", reply.c_str());
		return nullopt;
	}

	LogTrace("X: %" PRIuLEAST32 " points, %f origin, ref %f time/sample %lf\n",
		preamble->npoints, preamble->xorigin, preamble->xreference, preamble->sec_per_sample);
	LogTrace("Y: %f inc, %f origin, %f ref\n", preamble->yincrement, preamble->yorigin, preamble->yreference);
	return preamble;
}

/**
	@brief Gets the memory depth

	@return Depth in points, or zero if the scope is in AUTO depth mode or did not answer
 */
uint64_t RigolOscilloscope::GetSampleDepth()
{
	if(m_mdepth)
		return *m_mdepth;

	auto reply = Query(":ACQ:MDEP?");
	uint64_t depth = 0;
	if(1 != sscanf(reply.c_str(), "%" SCNu64, &depth))
	{
		LogDebug("Memory depth is \"%s\", not a fixed value\n", reply.c_str());
		depth = 0;
	}
	m_mdepth = depth;
	return depth;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Channel configuration

bool RigolOscilloscope::IsChannelEnabled(size_t i)
{
	if(i >= m_analogChannelCount)
		return false;

	if(m_channelsEnabled.find(i) != m_channelsEnabled.end())
		return m_channelsEnabled[i];

	auto reply = Query(":" + m_channels[i]->GetHwname() + ":DISP?");
	bool en = (reply == "1");
	m_channelsEnabled[i] = en;
	return en;
}

void RigolOscilloscope::EnableChannel(size_t i)
{
	if(i >= m_analogChannelCount)
		return;

	m_transport->SendCommandQueued(":" + m_channels[i]->GetHwname() + ":DISP ON");
	m_channelsEnabled[i] = true;

	//Available depths change with the number of enabled channels
	m_mdepth.reset();
}

void RigolOscilloscope::DisableChannel(size_t i)
{
	if(i >= m_analogChannelCount)
		return;

	m_transport->SendCommandQueued(":" + m_channels[i]->GetHwname() + ":DISP OFF");
	m_channelsEnabled[i] = false;
	m_mdepth.reset();
}

float RigolOscilloscope::GetChannelVoltageRange(size_t i)
{
	if(i >= m_analogChannelCount)
		return 1;

	if(m_channelVoltageRanges.find(i) != m_channelVoltageRanges.end())
		return m_channelVoltageRanges[i];

	auto reply = Query(":" + m_channels[i]->GetHwname() + ":RANGE?");
	float range;
	if(1 != sscanf(reply.c_str(), "%f", &range))
	{
		LogWarning("Bad range reply \"%s\" for %s\n", reply.c_str(), m_channels[i]->GetHwname().c_str());
		return NAN;
	}
	m_channelVoltageRanges[i] = range;
	return range;
}

void RigolOscilloscope::SetChannelVoltageRange(size_t i, float range)
{
	if(i >= m_analogChannelCount)
		return;

	m_transport->SendCommandQueued(":" + m_channels[i]->GetHwname() + ":RANGE " + to_string_sci(range));

	//Scope may round to the nearest step it supports, so don't cache
	m_channelVoltageRanges.erase(i);
}

float RigolOscilloscope::GetChannelOffset(size_t i)
{
	if(i >= m_analogChannelCount)
		return 0;

	if(m_channelOffsets.find(i) != m_channelOffsets.end())
		return m_channelOffsets[i];

	auto reply = Query(":" + m_channels[i]->GetHwname() + ":OFFS?");
	float offset;
	if(1 != sscanf(reply.c_str(), "%f", &offset))
	{
		LogWarning("Bad offset reply \"%s\" for %s\n", reply.c_str(), m_channels[i]->GetHwname().c_str());
		return 0;
	}
	m_channelOffsets[i] = offset;
	return offset;
}

void RigolOscilloscope::SetChannelOffset(size_t i, float offset)
{
	if(i >= m_analogChannelCount)
		return;

	m_transport->SendCommandQueued(":" + m_channels[i]->GetHwname() + ":OFFS " + to_string_sci(offset));
	m_channelOffsets[i] = offset;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Timebase

int64_t RigolOscilloscope::GetTimebaseScale()
{
	if(m_timebase)
		return *m_timebase;

	auto reply = Query(":TIM:MAIN:SCAL?");
	double sec;
	if(1 != sscanf(reply.c_str(), "%lf", &sec))
	{
		LogWarning("Bad timebase reply \"%s\"\n", reply.c_str());
		return 0;
	}
	m_timebase = static_cast<int64_t>(round(sec * FS_PER_SECOND));
	return *m_timebase;
}

void RigolOscilloscope::SetTimebaseScale(int64_t fsPerDiv)
{
	m_transport->SendCommandQueued(":TIM:MAIN:SCAL " + to_string_sci(fsPerDiv * SECONDS_PER_FS));
	m_timebase = fsPerDiv;

	//Depth in AUTO mode follows the timebase
	m_mdepth.reset();
}

vector<int64_t> RigolOscilloscope::GetTimebaseScales()
{
	//5 ns/div to 50 s/div
	vector<int64_t> ret;
	for(auto s : Oscilloscope::GetTimebaseScales())
	{
		if(s >= 5 * FS_PER_NANOSECOND)
			ret.push_back(s);
	}
	return ret;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Triggering

void RigolOscilloscope::StartSingleTrigger()
{
	LogTrace("Start single trigger\n");

	ClearPendingWaveforms();
	m_mdepth.reset();

	m_transport->SendCommandQueued(":SING");
	m_transport->SendCommandQueued("*WAI");
	m_triggerArmed = true;

	auto preamble = GetCapturePreamble();
	if(preamble)
		m_pointsWhenStarted = preamble->npoints;
	else
		m_pointsWhenStarted = 0;
}

void RigolOscilloscope::Stop()
{
	LogTrace("Explicit STOP requested\n");
	m_transport->SendCommandQueued(":STOP");
	m_transport->FlushCommandQueue();
	m_triggerArmed = false;
}

Oscilloscope::TriggerMode RigolOscilloscope::PollTrigger()
{
	if(!m_triggerArmed)
		return TRIGGER_MODE_STOP;

	//DS1000Z reports trigger status unreliably and may sit in STOP for the whole capture.
	//If the depth is fixed, watch the preamble point count instead: the capture is done once it matches.
	auto depth = GetSampleDepth();
	if(depth != 0)
	{
		auto preamble = GetCapturePreamble();
		if(!preamble)
			return TRIGGER_MODE_WAIT;

		if(preamble->npoints == depth)
		{
			m_triggerArmed = false;
			return TRIGGER_MODE_TRIGGERED;
		}
		if( (preamble->npoints == 0) || (preamble->npoints == m_pointsWhenStarted) )
			return TRIGGER_MODE_WAIT;
		return TRIGGER_MODE_RUN;
	}

	auto stat = Query(":TRIG:STAT?");
	if(stat == "TD")
		return TRIGGER_MODE_RUN;
	else if(stat == "RUN")
		return TRIGGER_MODE_RUN;
	else if(stat == "WAIT")
		return TRIGGER_MODE_WAIT;
	else if(stat == "AUTO")
		return TRIGGER_MODE_AUTO;
	else if(stat == "STOP")
	{
		//A single acquisition ends in STOP, so armed-and-stopped means we triggered
		m_triggerArmed = false;
		return TRIGGER_MODE_TRIGGERED;
	}

	return TRIGGER_MODE_WAIT;
}

/**
	@brief Reads a "#Nxxxx" block header

	@return Block length in bytes, or zero on failure
 */
uint64_t RigolOscilloscope::GetPendingWaveformBlockLength()
{
	char header_size_raw[3] = {0};
	if(2 != m_transport->ReadRawData(2, reinterpret_cast<unsigned char*>(header_size_raw)))
		return 0;

	char header_digit;
	if(sscanf(header_size_raw, "#%c", &header_digit) != 1)
		return 0;
	unsigned int header_size = header_digit - '0';
	if( (header_size == 0) || (header_size > 12) )
		return 0;

	char header[13] = {0};
	if(header_size != m_transport->ReadRawData(header_size, reinterpret_cast<unsigned char*>(header)))
		return 0;

	uint64_t blocksize = 0;
	if(1 != sscanf(header, "%" SCNu64, &blocksize))
		return 0;
	LogTrace("Parsed waveform block length %" PRIu64 "\n", blocksize);
	return blocksize;
}

bool RigolOscilloscope::AcquireData()
{
	lock_guard<recursive_mutex> lock(m_transport->GetMutex());
	LogIndenter li;

	LogTrace("Acquiring data\n");
	ClearPendingWaveforms();

	//Rigol scopes do not have a capture time so we fake it
	double now = GetTime();

	vector<unsigned char> temp_buf(MAX_BLOCK_POINTS + 1);
	bool ok = true;
	for(size_t channelIdx = 0; channelIdx < m_analogChannelCount; channelIdx++)
	{
		if(!IsChannelEnabled(channelIdx))
			continue;

		m_transport->SendCommandQueued(string("WAV:SOUR ") + m_channels[channelIdx]->GetHwname());
		auto preamble = GetCapturePreamble();
		if(!preamble)
		{
			ok = false;
			continue;
		}
		if(preamble->sec_per_sample == 0)
		{
			LogWarning("Got null sec_per_sample value from the scope, ignoring this waveform.\n");
			ok = false;
			continue;
		}
		size_t npoints = preamble->npoints;
		if(npoints == 0)
		{
			LogWarning("No points in %s\n", m_channels[channelIdx]->GetHwname().c_str());
			ok = false;
			continue;
		}

		auto cap = make_unique<UniformAnalogWaveform>();
		cap->m_timescale = round(preamble->sec_per_sample * FS_PER_SECOND);
		cap->m_triggerPhase = round(preamble->xorigin * FS_PER_SECOND);
		cap->m_startTimestamp = floor(now);
		cap->m_startFemtoseconds = (now - floor(now)) * FS_PER_SECOND;
		cap->m_samples.reserve(npoints);

		LogTrace("Channel %s samplerate %s\n",
			m_channels[channelIdx]->GetHwname().c_str(),
			Unit(Unit::UNIT_SAMPLERATE).PrettyPrint(cap->GetSampleRate()).c_str());

		//Scale: (value - Yorigin - Yref) * Yinc
		double ydelta = preamble->yorigin + preamble->yreference;

		//Only a limited number of points can be read at a time
		for(size_t npoint = 0; npoint < npoints;)
		{
			m_transport->SendCommandQueued("*WAI");
			m_transport->SendCommandQueued(string("WAV:STAR ") + to_string(npoint+1));	//ONE based indexing
			m_transport->SendCommandQueued(string("WAV:STOP ") + to_string(min(npoint + MAX_BLOCK_POINTS, npoints)));
			m_transport->SendCommandQueued("WAV:DATA?");
			m_transport->FlushCommandQueue();

			auto blocksize = GetPendingWaveformBlockLength();
			if(blocksize == 0)
			{
				LogWarning("Ran out of data after %zu points\n", npoint);
				unsigned char sink;
				m_transport->ReadRawData(1, &sink); //discard the trailing newline
				break;
			}
			if(blocksize > MAX_BLOCK_POINTS)
				blocksize = MAX_BLOCK_POINTS;

			//trailing newline after data block
			size_t bytesToRead = blocksize + 1;
			auto bytesRead = m_transport->ReadRawData(bytesToRead, temp_buf.data());
			if(bytesRead != bytesToRead)
			{
				LogWarning("requested %zu bytes, got %zu\n", bytesToRead, bytesRead);
				break;
			}

			for(size_t j = 0; j < blocksize; j++)
			{
				unsigned char raw = temp_buf[j];
				if( (raw == 0) || (raw == 255) )
					cap->m_flags |= WaveformBase::WAVEFORM_CLIPPING;
				cap->m_samples.push_back((static_cast<float>(raw) - ydelta) * preamble->yincrement);
			}

			npoint += blocksize;
		}

		if(cap->size() != npoints)
		{
			LogWarning("Incomplete download of %s: %zu of %zu points\n",
				m_channels[channelIdx]->GetHwname().c_str(), cap->size(), npoints);
			ok = false;
			continue;
		}

		SetChannelWaveform(channelIdx, std::move(cap));
	}

	return ok;
}

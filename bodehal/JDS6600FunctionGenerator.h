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
	@brief Declaration of JDS6600FunctionGenerator
 */

#ifndef JDS6600FunctionGenerator_h
#define JDS6600FunctionGenerator_h

/**
	@brief Driver for the JDS6600 series two channel DDS generator

	The instrument does not speak SCPI. Every setting lives in a numbered register which is written with
	":wNN=value." (acknowledged with ":ok") and read with ":rNN=0." (answered with ":rNN=v1,v2,...."). The
	transport is normally a UART at 115200 baud.
 */
class JDS6600FunctionGenerator
	: public virtual FunctionGenerator
	, public virtual SCPIInstrument
{
public:
	JDS6600FunctionGenerator(SCPITransport* transport);
	virtual ~JDS6600FunctionGenerator();

	virtual std::vector<WaveShape> GetAvailableWaveformShapes(int chan) override;

	virtual bool GetFunctionChannelActive(int chan) override;
	virtual bool SetFunctionChannelActive(int chan, bool on) override;

	virtual float GetFunctionChannelAmplitude(int chan) override;
	virtual bool SetFunctionChannelAmplitude(int chan, float amplitude) override;

	virtual float GetFunctionChannelOffset(int chan) override;
	virtual bool SetFunctionChannelOffset(int chan, float offset) override;

	virtual float GetFunctionChannelFrequency(int chan) override;
	virtual bool SetFunctionChannelFrequency(int chan, float hz) override;

	virtual WaveShape GetFunctionChannelShape(int chan) override;
	virtual bool SetFunctionChannelShape(int chan, WaveShape shape) override;

	virtual float GetFunctionChannelMaxFrequency(int chan) override;

	///@brief Operating modes as reported by the MODE register
	enum Mode
	{
		MODE_WAVE_CH1,
		MODE_WAVE_CH2,
		MODE_SYSTEM,
		MODE_MEASURE,
		MODE_COUNTER,
		MODE_SWEEP_CH1,
		MODE_SWEEP_CH2,
		MODE_PULSE,
		MODE_BURST,
		MODE_UNKNOWN
	};

	Mode GetMode();
	bool SetMode(Mode mode);
	bool StopAllActions();

	/**
		@brief Register map
	 */
	enum Register
	{
		REG_DEVICETYPE		= 0,
		REG_SERIALNUMBER	= 1,
		REG_CHANNELENABLE	= 20,
		REG_WAVEFORM1		= 21,
		REG_WAVEFORM2		= 22,
		REG_FREQUENCY1		= 23,
		REG_FREQUENCY2		= 24,
		REG_AMPLITUDE1		= 25,
		REG_AMPLITUDE2		= 26,
		REG_OFFSET1			= 27,
		REG_OFFSET2			= 28,
		REG_ACTION			= 32,
		REG_MODE			= 33
	};

	static std::string FormatWrite(int reg, const std::string& value);
	static std::string FormatRead(int reg);
	static std::optional< std::vector<int64_t> > ParseReadReply(int reg, const std::string& reply);

protected:
	bool WriteRegister(int reg, const std::string& value);
	std::optional< std::vector<int64_t> > ReadRegister(int reg);
	std::optional<int64_t> ReadRegisterScalar(int reg);

	bool ValidateChannel(int chan);

	///@brief Highest output frequency in Hz, from the device type register
	float m_maxFrequency;

public:
	static std::string GetDriverNameInternal();
	GENERATOR_INITPROC(JDS6600FunctionGenerator)
};

#endif

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
	@brief Declaration of Oscilloscope
 */

#ifndef Oscilloscope_h
#define Oscilloscope_h

/**
	@brief Generic representation of an oscilloscope

	An Oscilloscope contains triggering logic and one or more analog input channels. After a successful
	AcquireData() the waveform of each enabled channel is held by the scope until the caller takes it with
	PopChannelWaveform().
 */
class Oscilloscope : public virtual Instrument
{
public:
	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Construction / destruction

	Oscilloscope();
	virtual ~Oscilloscope();

	virtual unsigned int GetInstrumentTypes() const override
	{ return INST_OSCILLOSCOPE; }

	/**
		@brief Instruments are allowed to cache configuration settings to reduce round trip queries to the device.

		The default implementation does nothing since the base class provides no caching.
	 */
	virtual void FlushConfigCache();

	/**
		@brief Checks if the connection to the instrument has been lost

		@return True if the instrument is no longer responding
	 */
	virtual bool IsOffline();

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Channel configuration

	/**
		@brief Checks if a channel is enabled in hardware.
	 */
	virtual bool IsChannelEnabled(size_t i) =0;

	/**
		@brief Turn a channel on, given the index

		@param i Zero-based index of channel
	 */
	virtual void EnableChannel(size_t i) =0;

	/**
		@brief Turn a channel off, given the index.

		@param i Zero-based index of channel
	 */
	virtual void DisableChannel(size_t i) =0;

	/**
		@brief Gets the full scale range of a channel, in volts (eight vertical divisions on most instruments)
	 */
	virtual float GetChannelVoltageRange(size_t i) =0;

	/**
		@brief Sets the full scale range of a channel, in volts
	 */
	virtual void SetChannelVoltageRange(size_t i, float range) =0;

	///@brief Gets the vertical offset of a channel, in volts
	virtual float GetChannelOffset(size_t i) =0;

	///@brief Sets the vertical offset of a channel, in volts
	virtual void SetChannelOffset(size_t i, float offset) =0;

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Timebase

	/**
		@brief Gets the horizontal scale, in femtoseconds per division
	 */
	virtual int64_t GetTimebaseScale() =0;

	/**
		@brief Sets the horizontal scale, in femtoseconds per division

		The value should be one of those returned by GetTimebaseScales().
	 */
	virtual void SetTimebaseScale(int64_t fsPerDiv) =0;

	/**
		@brief Returns the supported horizontal scales, in femtoseconds per division, sorted ascending

		The default implementation is the 1-2-5 sequence from 1 ns/div to 50 s/div.
	 */
	virtual std::vector<int64_t> GetTimebaseScales();

	///@brief Returns the number of horizontal divisions on screen
	virtual size_t GetHorizontalDivisions()
	{ return 12; }

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Triggering

	enum TriggerMode
	{
		///@brief Armed and waiting for the trigger (or still filling the capture window)
		TRIGGER_MODE_RUN,

		///@brief Not armed
		TRIGGER_MODE_STOP,

		///@brief A capture completed and data is ready to download
		TRIGGER_MODE_TRIGGERED,

		///@brief Armed, waiting for the pre-trigger buffer to fill
		TRIGGER_MODE_WAIT,

		///@brief Free running
		TRIGGER_MODE_AUTO,

		TRIGGER_MODE_COUNT
	};

	/**
		@brief Checks the current trigger status
	 */
	virtual TriggerMode PollTrigger() =0;

	/**
		@brief Downloads the waveforms of all enabled channels after a trigger

		@return True on success, false if the download failed
	 */
	virtual bool AcquireData() =0;

	/**
		@brief Arms the trigger for a single acquisition
	 */
	virtual void StartSingleTrigger() =0;

	///@brief Stops acquiring
	virtual void Stop() =0;

	/**
		@brief Takes ownership of the last waveform acquired on a channel

		@return The waveform, or nullptr if no waveform is pending on the channel
	 */
	std::unique_ptr<UniformAnalogWaveform> PopChannelWaveform(size_t i);

protected:
	void SetChannelWaveform(size_t i, std::unique_ptr<UniformAnalogWaveform> wfm);
	void ClearPendingWaveforms();

	///@brief Waveforms downloaded by the last AcquireData() and not yet claimed
	std::map<size_t, std::unique_ptr<UniformAnalogWaveform> > m_pendingWaveforms;

	//Driver registration
public:
	typedef Oscilloscope* (*CreateProcType)(SCPITransport*);
	static void DoAddDriverClass(std::string name, CreateProcType proc);

	static Oscilloscope* CreateOscilloscope(std::string driver, SCPITransport* transport);

protected:
	typedef std::map< std::string, CreateProcType > CreateMapType;
	static CreateMapType m_createprocs;
};

#define OSCILLOSCOPE_INITPROC(T) \
	static Oscilloscope* CreateInstance(SCPITransport* transport) \
	{	return new T(transport); } \
	virtual std::string GetDriverName() const override \
	{ return GetDriverNameInternal(); }

#define AddDriverClass(T) Oscilloscope::DoAddDriverClass(T::GetDriverNameInternal(), T::CreateInstance)

#endif

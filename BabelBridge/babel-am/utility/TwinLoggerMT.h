#pragma once
/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.

	Based on: Vili Petek's theread safe simple logger (http://www.vilipetek.com)
*/

/*
	Description:
		Thread safe logger which writes to a log file and to std::cout. The per-item workers of the
		pipeline write to the same log file from several threads.
		When the log file grows over the maximum size a new file with an index is started
		(babel_universal_am.log -> babel_universal_am_1.log -> ...).

	Usage:
		oTwinLog.init("babel_universal_am.log", true);
		LOGTW_INFO << "[" << item << "] Message"; //NOTE: no new line is needed, added automatically
*/
#include <babel-am/stdafx.h>

#include <ctime>

namespace twinLogger {

	// log message levels
	enum Level { Debug, Info, Warning, Error, FatalError };
	class TwinLoggerMT;

	class BABELBRIDGE_API LogStream : public std::ostringstream
	{
	public:
		LogStream(TwinLoggerMT& oLogger, Level nLevel, std::string extraInfo);
		LogStream(const LogStream& ls);
		~LogStream();

	private:
		TwinLoggerMT& m_oLogger;
		Level m_nLevel;
		std::string m_extraInfo;
	};

	class BABELBRIDGE_API TwinLoggerMT
	{
	public:
		TwinLoggerMT();
		virtual ~TwinLoggerMT();
		//set the log file name, whether to append to an existing log file, and the max size of one log file in MB
		void init(std::string filename, bool bAppend = true, int maxsize = 10);
		void log(Level nLevel, std::string oMessage, std::string extraInfo);
		//operator to make logging easier
		LogStream operator()();
		LogStream operator()(Level nLevel);
		LogStream operator()(Level nLevel, std::string filename, int linenumber);

	private:
		const tm* getLocalTime();
		void openlog(std::string filename, bool bAppend);

	private:
		std::mutex		m_oMutex;
		std::ofstream	m_oFile;
		tm				m_oLocalTime;
		int				m_maxSizeMB;
		Level			m_nMinLevel;
	};
}

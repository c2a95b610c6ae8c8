#ifndef PACKET_MINER_ERRORS_H
#define PACKET_MINER_ERRORS_H
#include <stdexcept>
#include <string>

namespace packet_miner {
	class Error : public std::runtime_error {
	public:
		using std::runtime_error::runtime_error;
	};

	// Malformed markup or input document; fatal to the table being read.
	class FormatError : public Error {
	public:
		using Error::Error;
	};

	// Name and type columns do not describe the same rows.
	// Recoverable per packet.
	class SymmetryError : public Error {
	public:
		using Error::Error;
	};

	// The page no longer matches the expected dialect. Fatal to the run.
	class DialectError : public Error {
	public:
		using Error::Error;
	};

	class MissingTableError : public Error {
	public:
		using Error::Error;
	};

	class DepthLimitError : public Error {
	public:
		using Error::Error;
	};
}

#endif

#pragma once
#include <DASL/Cid/Cid.hpp>
#include <DASL/Defines.hpp>
#include <DASL/Drisl/ByteCursor.hpp>
#include <DASL/Drisl/DecodeError.hpp>
#include <DASL/Drisl/Decoder.hpp>
#include <DASL/Drisl/EncodeError.hpp>
#include <DASL/Drisl/Encoder.hpp>
#include <DASL/Drisl/StreamDecoder.hpp>
#include <DASL/Drisl/Value.hpp>
#include <DASL/IO/FileReader.hpp>
#include <DASL/IO/IByteReader.hpp>
#include <DASL/IO/MemoryReader.hpp>
#include <DASL/Primitives.hpp>
#include <DASL/Utilities/Encoding.hpp>
#include <DASL/Utilities/Expected.hpp>

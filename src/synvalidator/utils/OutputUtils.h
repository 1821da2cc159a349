#pragma once

#include <fstream>
#include <ostream>
#include <streambuf>
#include <string>

namespace synvalidator
{
namespace utils
{

/**
 * @brief Stream buffer that mirrors output to two underlying buffers
 *
 * Used by the command line driver to send the run log to the console and to
 * a log file at the same time.
 */
class TeeBuf : public std::streambuf
{
public:
    TeeBuf(std::streambuf* sb1, std::streambuf* sb2);

protected:
    /**
     * @return EOF if either buffer rejects the character, otherwise c
     */
    int overflow(int c) override;

    /**
     * @return 0 when both buffers synced, -1 otherwise
     */
    int sync() override;

private:
    std::streambuf* mStreamBuf1;
    std::streambuf* mStreamBuf2;
};

/**
 * @brief Output stream that writes to two streams simultaneously
 */
class TeeStream : public std::ostream
{
public:
    TeeStream(std::ostream& streamA, std::ostream& streamB);

private:
    TeeBuf mTeeBuf;
};

/**
 * @brief Open a file for writing, truncating it.
 * @param what short description used in the error message ("report", "log")
 * @throws std::runtime_error if the file cannot be opened
 */
void openOutputFile(std::ofstream& file, const std::string& path, const std::string& what);

/**
 * @brief Read a whole file into a string.
 * @throws std::runtime_error if the file does not exist or cannot be read
 */
std::string readFileContents(const std::string& path);

} // namespace utils
} // namespace synvalidator

// tcptx client: sends one payload to a TCP server and prints the reply
#include "tcptx/InvalidInputException.hpp"
#include "tcptx/TransactionClient.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

using namespace std;
using namespace tcptx;

namespace
{

void printUsage(const char* argv0)
{
    cerr << "Usage: " << argv0 << " [options] [address [port [payload]]]\n"
         << "Missing positional arguments are asked for interactively.\n\n"
         << "Options:\n"
         << "  --timeout <ms>    timeout of every phase (default " << DefaultPhaseTimeout.count() << ")\n"
         << "  --buffer <bytes>  receive buffer capacity (default " << DefaultReceiveBufferSize << ")\n"
         << "  --separate-send   write the payload in its own phase instead of with the connect\n"
         << "  --alert           also show every failure as a blocking alert\n"
         << "  --help            show this text\n";
}

/**
 * @brief Timestamped console log line, as written for every failed transaction.
 */
void consoleLog(const string& message)
{
    static mutex logMutex;

    const auto now = chrono::system_clock::to_time_t(chrono::system_clock::now());
    tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif

    const lock_guard lock(logMutex);
    clog << '[' << put_time(&local, "%H:%M:%S") << "] " << message << endl;
}

template <typename T> bool parseNumber(const string& text, T& out)
{
    stringstream myStream(text);
    return (myStream >> out) && myStream.eof();
}

string prompt(const string& question)
{
    cout << question;
    string answer;
    getline(cin, answer);
    return answer;
}

} // namespace

int main(int argc, char* argv[])
{
    ClientConfig config;
    size_t bufferSize = DefaultReceiveBufferSize;
    vector<string> positional;

    for (int i = 1; i < argc; ++i)
    {
        const string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "--separate-send")
        {
            config.sendMode = SendMode::Separate;
        }
        else if (arg == "--alert")
        {
            config.showAlerts = true;
        }
        else if (arg == "--timeout" || arg == "--buffer")
        {
            long long value = 0;
            if (i + 1 >= argc || !parseNumber(argv[i + 1], value) || value <= 0)
            {
                cerr << "Error: " << arg << " needs a positive number." << endl;
                return 2;
            }
            ++i;
            if (arg == "--timeout")
                config.connectTimeout = config.sendTimeout = config.receiveTimeout = chrono::milliseconds{value};
            else
                bufferSize = static_cast<size_t>(value);
        }
        else if (arg.starts_with("--"))
        {
            cerr << "Error: unknown option " << arg << endl;
            printUsage(argv[0]);
            return 2;
        }
        else
        {
            positional.push_back(arg);
        }
    }

    if (positional.size() > 3)
    {
        printUsage(argv[0]);
        return 2;
    }

    const string address =
        positional.size() > 0 ? positional[0] : prompt("Type the IP to connect to (127.0.0.1 for this machine): ");

    int port = 0;
    if (positional.size() > 1)
    {
        if (!parseNumber(positional[1], port))
        {
            cerr << "Error: Invalid port number " << positional[1] << endl;
            return 2;
        }
    }
    else
    {
        while (!parseNumber(prompt("Type the port to connect to: "), port))
        {
            if (!cin)
            {
                cerr << "Error: no port given before end of input." << endl;
                return 2;
            }
            cout << "Error: Invalid port number. Port must be between 1 and 65535." << endl;
        }
    }

    const string payload = positional.size() > 2 ? positional[2] : prompt("Type the data to send: ");

    TransactionResult result;
    vector<char> reply(bufferSize);
    try
    {
        const TransactionClient client(consoleLog, config);
        result = client.transact(address, port, payload, reply);
    }
    catch (const InvalidInputException& e)
    {
        cerr << "Error: " << e.what() << endl;
        return 2;
    }

    if (!result.success)
        return 1;

    cout << "Received " << result.bytesReceived << " bytes: " << trimTrailingZeros(reply) << endl;
    return 0;
}

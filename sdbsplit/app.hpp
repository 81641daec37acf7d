#pragma once

#include <functional>
#include <memory>
#include <ostream>
#include <string>

#include <sdbsplit/configuration.hpp>
#include <sdbsplit/options.hpp>
#include <sdbsplit/store-client.hpp>

namespace sdbsplit
{

class App
{
public:
    using ClientFactory =
        std::function<std::unique_ptr<StoreClient>(const Options&)>;

    // Without a factory, every store client is a SimpleDbClient.
    App(const Configuration& config, ClientFactory factory = ClientFactory());

    // Runs the configured command, writing its results to the given stream.
    // Progress and diagnostics are logged to stderr.
    void run(std::ostream& out);

    static std::string usage();

private:
    void plan();
    void read();
    void count(std::ostream& out);
    void unique(std::ostream& out);
    void merge();

    const Options& options();
    const std::string& arg(std::size_t i, const std::string& name) const;

    Configuration m_config;
    ClientFactory m_factory;
    std::unique_ptr<Options> m_options;
};

} // namespace sdbsplit

#include "ingredients/classification_service.hpp"
#include "ingredients/completion_client.hpp"
#include "ingredients/config.hpp"
#include "ingredients/error.hpp"
#include "ingredients/ingredient_handler.hpp"
#include "ingredients/logging.hpp"
#include "ingredients/server.hpp"
#include "ingredients/version.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <iostream>
#include <thread>

int main()
{
  ingredients::ServiceConfig config;
  try
  {
    config = ingredients::load_config_from_env();
  }
  catch (const ingredients::ConfigurationError& error)
  {
    std::cerr << "Configuration error: " << error.what() << std::endl;
    return 1;
  }

  config.client.logger = ingredients::make_stream_logger(std::cerr);
  ingredients::Logger logger(config.client.log_level, config.client.logger);

  try
  {
    ingredients::CompletionClient client(config.client);
    ingredients::ClassificationService service(client, logger);
    ingredients::IngredientHandler handler(service, logger);
    ingredients::Server server(handler, config.server, logger);
    server.init();

    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait(
        [&](const boost::system::error_code& ec, int signal_number)
        {
          if (!ec)
          {
            logger.log(ingredients::LogLevel::Info, "shutting down", {{"signal", signal_number}});
            server.stop();
          }
        });
    std::thread signal_thread([&signal_context] { signal_context.run(); });

    logger.log(ingredients::LogLevel::Info, "ingredient classifier started",
               {{"version", ingredients::kVersion},
                {"model", config.client.model},
                {"endpoint", config.client.endpoint},
                {"timeout_ms", config.client.timeout.count()}});
    try
    {
      server.run();
    }
    catch (...)
    {
      signal_context.stop();
      signal_thread.join();
      throw;
    }

    signal_context.stop();
    signal_thread.join();
  }
  catch (const ingredients::ConfigurationError& error)
  {
    std::cerr << "Configuration error: " << error.what() << std::endl;
    return 1;
  }
  catch (const ingredients::IngredientsError& error)
  {
    std::cerr << "Fatal error: " << error.what() << std::endl;
    return 1;
  }
  catch (const std::exception& error)
  {
    std::cerr << "Unexpected error: " << error.what() << std::endl;
    return 1;
  }

  return 0;
}
